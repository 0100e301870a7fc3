// src/multisig/model/src/Amount.cpp
#include "multisig/model/include/Amount.hpp"
#include "multisig/errors/include/MultiSigException.hpp"
#include <limits>

namespace multisig_engine::multisig
{
    using boost::multiprecision::cpp_int;

    uint256_t ParseAmount(const std::string& amount, unsigned decimals)
    {
        size_t start = amount.find_first_not_of(" \t\r\n");
        size_t end = amount.find_last_not_of(" \t\r\n");
        if (start == std::string::npos) {
            throw InvalidAmountException(amount);
        }
        std::string body = amount.substr(start, end - start + 1);

        std::string integer_part = body;
        std::string fraction_part;
        size_t dot = body.find('.');
        if (dot != std::string::npos) {
            integer_part = body.substr(0, dot);
            fraction_part = body.substr(dot + 1);
        }

        if (integer_part.empty() && fraction_part.empty()) {
            throw InvalidAmountException(amount);
        }
        if (fraction_part.size() > decimals) {
            throw InvalidAmountException(amount);
        }

        cpp_int value = 0;
        for (char c : integer_part) {
            if (c < '0' || c > '9') {
                throw InvalidAmountException(amount);
            }
            value = value * 10 + (c - '0');
        }
        for (char c : fraction_part) {
            if (c < '0' || c > '9') {
                throw InvalidAmountException(amount);
            }
            value = value * 10 + (c - '0');
        }
        for (size_t i = fraction_part.size(); i < decimals; ++i) {
            value *= 10;
        }

        if (value > cpp_int(std::numeric_limits<uint256_t>::max())) {
            throw InvalidAmountException(amount);
        }
        return static_cast<uint256_t>(value);
    }

    bool IsValidAmount(const std::string& amount, unsigned decimals)
    {
        try {
            ParseAmount(amount, decimals);
            return true;
        } catch (const InvalidAmountException&) {
            return false;
        }
    }

    std::string ToDecimalString(const uint256_t& value)
    {
        return value.str();
    }
}
