// src/common/utils/clock/Clock.hpp
#pragma once
#include <chrono>
#include <cstdint>

namespace multisig_engine::utils
{
    /**
     * @brief 현재 시각 공급자
     *
     * 만료 판정(expires_at)이 시각에 의존하므로 테스트에서 교체할 수 있도록 인터페이스로 둡니다.
     * 모든 시각은 Unix epoch 기준 밀리초입니다.
     */
    class IClock
    {
    public:
        virtual ~IClock() = default;
        virtual int64_t NowMs() const = 0;
    };

    class SystemClock : public IClock
    {
    public:
        int64_t NowMs() const override
        {
            return std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::system_clock::now().time_since_epoch()).count();
        }
    };

    constexpr int64_t HoursToMs(int64_t hours) { return hours * 60 * 60 * 1000; }
}
