// include/DriverFetch/Utils/Cancellation.hpp
#ifndef CANCELLATION_UTIL_HPP
#define CANCELLATION_UTIL_HPP

#include <atomic>
#include <memory>

namespace DriverFetch::Utils {

    // Copies share one flag. A default-constructed token can still be cancelled.
    class CancellationToken {
    public:
        CancellationToken() : m_flag(std::make_shared<std::atomic<bool>>(false)) {}

        void cancel() const { m_flag->store(true); }
        bool isCancelled() const { return m_flag->load(); }

    private:
        std::shared_ptr<std::atomic<bool>> m_flag;
    };

} // namespace DriverFetch::Utils

#endif // CANCELLATION_UTIL_HPP
