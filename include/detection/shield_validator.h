#ifndef SHIELD_VALIDATOR_H_
#define SHIELD_VALIDATOR_H_

#include <string>

#include "core/shield_types.h"

namespace shield {

/**
 * Validator - format and checksum checks per PII type
 *
 * All functions are pure: no state, no I/O, no exceptions. A failed check
 * only means "discard this candidate".
 */
class Validator {
 public:
  // Luhn checksum over the digits of `number`; 13-19 digits required
  static bool IsValidCreditCard(const std::string& number);

  // 9 digits; rejects area 000, 666, 734-749, 900+, group 00, serial 0000
  static bool IsValidSSN(const std::string& ssn);

  // RFC 5321 length limits plus basic local/domain structure
  static bool IsValidEmail(const std::string& email);

  // 10 digits with a dialable area code, or 11-15 digits
  static bool IsValidPhone(const std::string& phone);

  // Dotted-quad IPv4, each octet 0-255
  static bool IsValidIPAddress(const std::string& ip);

  // Three '/' or '-' separated parts, one 4-digit year in [1900, max_year],
  // the other parts in [1, 31]
  static bool IsValidDateOfBirth(const std::string& dob, int max_year);
  static bool IsValidDateOfBirth(const std::string& dob);

  // 1-2 upper-case letters followed by 6-9 digits, nothing else
  static bool IsValidPassport(const std::string& passport);

  /**
   * Dispatch to the check for `type`. Types without a dedicated check
   * always pass.
   */
  static bool Validate(const std::string& value, PIIType type);

  // Calendar year of the local clock
  static int CurrentYear();
};

}  // namespace shield

#endif  // SHIELD_VALIDATOR_H_
