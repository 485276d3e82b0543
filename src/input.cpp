#include "input.hpp"

bool Input::consumeGg(int ch) {
  if (ch == 'g') {
    if (pending_g_) { pending_g_ = false; return true; }
    pending_g_ = true; return false;
  }
  pending_g_ = false;
  return false;
}

bool Input::consumeDigit(int ch) {
  if (ch >= '1' && ch <= '9') {
    if (pending_count_ < 100000) pending_count_ = pending_count_ * 10 + static_cast<size_t>(ch - '0');
    return true;
  }
  if (ch == '0' && pending_count_ > 0) {
    if (pending_count_ < 100000) pending_count_ = pending_count_ * 10;
    return true;
  }
  return false;
}

bool Input::hasCount() const {
  return pending_count_ > 0;
}

size_t Input::takeCount() {
  size_t c = pending_count_;
  pending_count_ = 0;
  return c;
}

void Input::reset() {
  pending_g_ = false;
  pending_count_ = 0;
}
