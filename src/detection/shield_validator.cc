#include "detection/shield_validator.h"

#include <ctime>
#include <regex>
#include <vector>

#include "util/shield_text_utils.h"

namespace shield {

namespace {

// Parses a short all-digit string; false on anything else
bool ParseSmallInt(const std::string& s, int* out) {
  if (!text::IsAllDigits(s) || s.size() > 9) {
    return false;
  }
  int value = 0;
  for (char c : s) {
    value = value * 10 + (c - '0');
  }
  *out = value;
  return true;
}

std::vector<std::string> SplitOn(const std::string& s, const char* delimiters) {
  std::vector<std::string> parts;
  size_t start = 0;
  while (true) {
    size_t pos = s.find_first_of(delimiters, start);
    if (pos == std::string::npos) {
      parts.push_back(s.substr(start));
      break;
    }
    parts.push_back(s.substr(start, pos - start));
    start = pos + 1;
  }
  return parts;
}

}  // namespace

bool Validator::IsValidCreditCard(const std::string& number) {
  const std::string digits = text::DigitsOnly(number);
  if (digits.size() < 13 || digits.size() > 19) {
    return false;
  }

  int checksum = 0;
  bool double_it = false;
  for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
    int d = *it - '0';
    if (double_it) {
      d *= 2;
      if (d > 9) {
        d -= 9;
      }
    }
    checksum += d;
    double_it = !double_it;
  }
  return checksum % 10 == 0;
}

bool Validator::IsValidSSN(const std::string& ssn) {
  std::string clean;
  for (char c : ssn) {
    if (c != '-' && c != ' ' && c != '\t' && c != '\n' && c != '\r') {
      clean.push_back(c);
    }
  }
  if (clean.size() != 9 || !text::IsAllDigits(clean)) {
    return false;
  }

  int area = 0, group = 0, serial = 0;
  ParseSmallInt(clean.substr(0, 3), &area);
  ParseSmallInt(clean.substr(3, 2), &group);
  ParseSmallInt(clean.substr(5, 4), &serial);

  if (area == 0 || area == 666 || area >= 900) {
    return false;
  }
  if (group == 0 || serial == 0) {
    return false;
  }
  // Never issued by the SSA
  if (area >= 734 && area <= 749) {
    return false;
  }
  return true;
}

bool Validator::IsValidEmail(const std::string& email) {
  if (email.size() > 254) {
    return false;
  }

  size_t at = email.find('@');
  if (at == std::string::npos || email.find('@', at + 1) != std::string::npos) {
    return false;
  }

  const std::string local = email.substr(0, at);
  const std::string domain = email.substr(at + 1);

  if (local.empty() || local.size() > 64) {
    return false;
  }
  if (domain.empty() || domain.size() > 253) {
    return false;
  }
  if (domain.find('.') == std::string::npos) {
    return false;
  }
  for (const auto& label : SplitOn(domain, ".")) {
    if (label.empty()) {
      return false;
    }
  }
  return true;
}

bool Validator::IsValidPhone(const std::string& phone) {
  const std::string digits = text::DigitsOnly(phone);

  if (digits.size() == 10) {
    int area_code = 0;
    ParseSmallInt(digits.substr(0, 3), &area_code);
    if (area_code < 200 || area_code == 911 || area_code == 988) {
      return false;
    }
    return true;
  }

  // International, with country code
  return digits.size() >= 11 && digits.size() <= 15;
}

bool Validator::IsValidIPAddress(const std::string& ip) {
  const auto parts = SplitOn(ip, ".");
  if (parts.size() != 4) {
    return false;
  }
  for (const auto& part : parts) {
    int octet = 0;
    if (!ParseSmallInt(part, &octet) || octet > 255) {
      return false;
    }
  }
  return true;
}

bool Validator::IsValidDateOfBirth(const std::string& dob, int max_year) {
  const auto parts = SplitOn(dob, "/-");
  if (parts.size() != 3) {
    return false;
  }

  int year = -1;
  int year_parts = 0;
  for (const auto& part : parts) {
    if (part.size() == 4) {
      ++year_parts;
      if (!ParseSmallInt(part, &year)) {
        return false;
      }
    }
  }
  if (year_parts != 1) {
    return false;
  }
  if (year < 1900 || year > max_year) {
    return false;
  }

  for (const auto& part : parts) {
    if (part.size() <= 2) {
      int value = 0;
      if (!ParseSmallInt(part, &value) || value < 1 || value > 31) {
        return false;
      }
    }
  }
  return true;
}

bool Validator::IsValidDateOfBirth(const std::string& dob) {
  return IsValidDateOfBirth(dob, CurrentYear());
}

bool Validator::IsValidPassport(const std::string& passport) {
  static const std::regex passport_re(R"([A-Z]{1,2}\d{6,9})");
  return std::regex_match(passport, passport_re);
}

bool Validator::Validate(const std::string& value, PIIType type) {
  switch (type) {
    case PIIType::CREDIT_CARD: return IsValidCreditCard(value);
    case PIIType::SSN: return IsValidSSN(value);
    case PIIType::EMAIL: return IsValidEmail(value);
    case PIIType::PHONE: return IsValidPhone(value);
    case PIIType::IP_ADDRESS: return IsValidIPAddress(value);
    case PIIType::DATE_OF_BIRTH: return IsValidDateOfBirth(value);
    case PIIType::PASSPORT: return IsValidPassport(value);
    default: return true;
  }
}

int Validator::CurrentYear() {
  std::time_t now = std::time(nullptr);
  std::tm local{};
  localtime_r(&now, &local);
  return local.tm_year + 1900;
}

}  // namespace shield
