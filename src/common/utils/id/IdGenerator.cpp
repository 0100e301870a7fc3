// src/common/utils/id/IdGenerator.cpp
#include "common/utils/id/IdGenerator.hpp"
#include <openssl/err.h>
#include <openssl/rand.h>
#include <stdexcept>

namespace multisig_engine::utils
{
    std::vector<uint8_t> IdGenerator::RandomBytes(size_t length)
    {
        std::vector<uint8_t> bytes(length);
        if (length == 0) {
            return bytes;
        }

        if (RAND_bytes(bytes.data(), static_cast<int>(length)) != 1) {
            char err_buf[256];
            ERR_error_string_n(ERR_get_error(), err_buf, sizeof(err_buf));
            throw std::runtime_error(std::string("RAND_bytes failed: ") + err_buf);
        }
        return bytes;
    }

    std::string IdGenerator::NewUuid()
    {
        std::vector<uint8_t> bytes = RandomBytes(16);

        // RFC 4122 version 4, variant 10
        bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);
        bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);

        static const char* digits = "0123456789abcdef";
        std::string uuid;
        uuid.reserve(36);

        for (size_t i = 0; i < bytes.size(); ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) {
                uuid.push_back('-');
            }
            uuid.push_back(digits[bytes[i] >> 4]);
            uuid.push_back(digits[bytes[i] & 0x0F]);
        }
        return uuid;
    }
}
