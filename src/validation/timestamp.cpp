#include "validation/timestamp.hpp"

#include <cstddef>

namespace jtdv::validation {

namespace {

class Cursor {
public:
  explicit Cursor(std::string_view text) : text_(text) {}

  bool Digits(std::size_t count, int& value) {
    if (pos_ + count > text_.size()) {
      return false;
    }
    int parsed = 0;
    for (std::size_t i = 0; i < count; ++i) {
      const char c = text_[pos_ + i];
      if (c < '0' || c > '9') {
        return false;
      }
      parsed = parsed * 10 + (c - '0');
    }
    pos_ += count;
    value = parsed;
    return true;
  }

  bool Expect(char expected) {
    if (pos_ >= text_.size() || text_[pos_] != expected) {
      return false;
    }
    ++pos_;
    return true;
  }

  bool ExpectAny(char first, char second) {
    return Expect(first) || Expect(second);
  }

  // Consumes one or more digits.
  bool SkipDigits() {
    const std::size_t start = pos_;
    while (pos_ < text_.size() && text_[pos_] >= '0' && text_[pos_] <= '9') {
      ++pos_;
    }
    return pos_ > start;
  }

  bool Done() const {
    return pos_ == text_.size();
  }

private:
  std::string_view text_;
  std::size_t pos_ = 0;
};

bool IsLeapYear(int year) {
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int DaysInMonth(int year, int month) {
  switch (month) {
  case 2:
    return IsLeapYear(year) ? 29 : 28;
  case 4:
  case 6:
  case 9:
  case 11:
    return 30;
  default:
    return 31;
  }
}

} // namespace

bool IsRfc3339Timestamp(std::string_view text) {
  Cursor cursor(text);

  int year = 0;
  int month = 0;
  int day = 0;
  if (!cursor.Digits(4, year) || !cursor.Expect('-') || !cursor.Digits(2, month) ||
      !cursor.Expect('-') || !cursor.Digits(2, day)) {
    return false;
  }
  if (month < 1 || month > 12 || day < 1 || day > DaysInMonth(year, month)) {
    return false;
  }

  if (!cursor.ExpectAny('T', 't')) {
    return false;
  }

  int hour = 0;
  int minute = 0;
  int second = 0;
  if (!cursor.Digits(2, hour) || !cursor.Expect(':') || !cursor.Digits(2, minute) ||
      !cursor.Expect(':') || !cursor.Digits(2, second)) {
    return false;
  }
  if (hour > 23 || minute > 59 || second > 60) {
    return false;
  }

  if (cursor.Expect('.') && !cursor.SkipDigits()) {
    return false;
  }

  if (cursor.ExpectAny('Z', 'z')) {
    return cursor.Done();
  }

  if (!cursor.ExpectAny('+', '-')) {
    return false;
  }
  int offset_hour = 0;
  int offset_minute = 0;
  if (!cursor.Digits(2, offset_hour) || !cursor.Expect(':') ||
      !cursor.Digits(2, offset_minute)) {
    return false;
  }
  if (offset_hour > 23 || offset_minute > 59) {
    return false;
  }

  return cursor.Done();
}

} // namespace jtdv::validation
