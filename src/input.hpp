#pragma once
#include <cstddef>
/*
 * Input
 *
 * Purpose: parse multi-key browse sequences (vim `gg`, count prefixes like
 *          `5j`) with minimal state.
 * Note: any other key cancels a pending `g`; the caller decides what a bare
 *       key means when a sequence does not complete.
 */

class Input {
public:
  bool consumeGg(int ch);
  bool consumeDigit(int ch);
  bool hasCount() const;
  size_t takeCount();
  void reset();
private:
  bool pending_g_ = false;
  size_t pending_count_ = 0;
};
