// src/common/utils/id/IdGenerator.hpp
#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace multisig_engine::utils
{
    /**
     * @brief 레코드 ID 생성기
     *
     * OpenSSL RAND_bytes 기반 UUID v4 문자열을 생성합니다.
     * RNG 실패 시 std::runtime_error
     */
    class IdGenerator
    {
    public:
        static std::string NewUuid();

        /**
         * @brief 암호학적 난수 바이트
         * @param length 바이트 수
         */
        static std::vector<uint8_t> RandomBytes(size_t length);
    };
}
