#pragma once

#include "shared/exception/DomainException.hpp"
#include <string>

namespace epassport::pa::domain::model {

/// LDS data group DG1 (MRZ) through DG16. DG2 holds the face image,
/// DG14/DG15 the chip authentication and active authentication keys.
enum class DataGroupNumber : int {
    DG1 = 1, DG2, DG3, DG4, DG5, DG6, DG7, DG8,
    DG9, DG10, DG11, DG12, DG13, DG14, DG15, DG16
};

constexpr int kMaxDataGroupNumber = 16;

inline int toInt(DataGroupNumber dgn) {
    return static_cast<int>(dgn);
}

/// @throws DomainException INVALID_DATA_GROUP_NUMBER outside 1..16
inline DataGroupNumber dataGroupNumberFromInt(int value) {
    if (value < 1 || value > kMaxDataGroupNumber) {
        throw shared::exception::DomainException("INVALID_DATA_GROUP_NUMBER",
            "Data group number out of range: " + std::to_string(value));
    }
    return static_cast<DataGroupNumber>(value);
}

inline std::string toString(DataGroupNumber dgn) {
    return "DG" + std::to_string(toInt(dgn));
}

/**
 * Accepts "DG1".."DG16", prefix in either case.
 * @throws DomainException INVALID_DATA_GROUP_NUMBER
 */
inline DataGroupNumber dataGroupNumberFromString(const std::string& str) {
    const bool prefixOk = str.size() >= 3 && str.size() <= 4 &&
                          (str[0] == 'D' || str[0] == 'd') && (str[1] == 'G' || str[1] == 'g');
    const bool digitsOk = prefixOk &&
                          str.find_first_not_of("0123456789", 2) == std::string::npos;
    if (!digitsOk) {
        throw shared::exception::DomainException("INVALID_DATA_GROUP_NUMBER",
            "Expected DG1..DG16, got '" + str + "'");
    }
    return dataGroupNumberFromInt(std::stoi(str.substr(2)));
}

} // namespace epassport::pa::domain::model
