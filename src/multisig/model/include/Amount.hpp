// src/multisig/model/include/Amount.hpp
#pragma once
#include <boost/multiprecision/cpp_int.hpp>
#include <string>

namespace multisig_engine::multisig
{
    using uint256_t = boost::multiprecision::uint256_t;

    constexpr unsigned NATIVE_DECIMALS = 18;

    /**
     * @brief 10진 금액 문자열 → 최소 단위 정수 (ether → wei)
     *
     * "1.5" → 1500000000000000000. 앞뒤 공백 허용, 부호/지수 표기 불가,
     * 소수점 이하 최대 decimals 자리. 위반 시 InvalidAmountException
     */
    uint256_t ParseAmount(const std::string& amount, unsigned decimals = NATIVE_DECIMALS);

    bool IsValidAmount(const std::string& amount, unsigned decimals = NATIVE_DECIMALS);

    // 10진 문자열 (RPC 로그/감사 메타데이터용)
    std::string ToDecimalString(const uint256_t& value);
}
