/**
 * @file CancellationToken.hpp
 * @brief Cooperative cancellation flag shared between a caller and a run.
 */

#pragma once
#include <atomic>
#include <memory>

namespace filegate::domain {

class CancellationToken {
public:
    CancellationToken() : m_flag(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { m_flag->store(true); }
    bool isCancelled() const { return m_flag->load(); }

private:
    std::shared_ptr<std::atomic<bool>> m_flag;
};

} // namespace filegate::domain
