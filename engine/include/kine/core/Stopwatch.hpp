#pragma once

#include <chrono>
#include <cstdint>

namespace kine::core {

    // Accumulates the cost of repeated start/stop sections
    class Stopwatch {
    public:
        void start() {
            m_start = std::chrono::steady_clock::now();
        }

        // Returns the length of the section in microseconds
        double stop() {
            std::chrono::duration<double, std::micro> delta = std::chrono::steady_clock::now() - m_start;
            m_totalMicros += delta.count();
            ++m_samples;
            return delta.count();
        }

        void reset() {
            m_totalMicros = 0.0;
            m_samples = 0;
        }

        [[nodiscard]] uint64_t samples() const { return m_samples; }
        [[nodiscard]] double totalMicroseconds() const { return m_totalMicros; }

        [[nodiscard]] double averageMicroseconds() const {
            return m_samples == 0 ? 0.0 : m_totalMicros / static_cast<double>(m_samples);
        }

    private:
        std::chrono::steady_clock::time_point m_start = std::chrono::steady_clock::now();
        double m_totalMicros = 0.0;
        uint64_t m_samples = 0;
    };

}
