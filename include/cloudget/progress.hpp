#ifndef CLOUDGET_PROGRESS_HPP
#define CLOUDGET_PROGRESS_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include <cloudget/export.hpp>

namespace cloudget
{
    // Aggregates the byte counters of all transfers of one download.
    // Purely observational: nothing in the engine depends on its values.
    class CLOUDGET_API ProgressTracker
    {
    public:
        using callback_type = std::function<void(std::uint64_t done, std::uint64_t total)>;

        explicit ProgressTracker(std::uint64_t total = 0,
                                 std::size_t transfers = 1,
                                 callback_type callback = {});

        void set_callback(callback_type callback);
        void reset(std::uint64_t total, std::size_t transfers);

        // Sets the number of bytes transfer `index` has received so far.
        void update(std::size_t index, std::uint64_t transferred);

        // A retried transfer starts from zero again.
        void restart(std::size_t index);

        std::uint64_t done() const noexcept
        {
            return m_done;
        }

        std::uint64_t total() const noexcept
        {
            return m_total;
        }

        std::chrono::steady_clock::duration elapsed() const;

        // Average bytes per second since construction or the last `reset()`.
        double speed() const;

    private:
        void notify();

        std::uint64_t m_total;
        std::uint64_t m_done = 0;
        std::vector<std::uint64_t> m_per_transfer;
        std::chrono::steady_clock::time_point m_start;
        callback_type m_callback;
    };

    // One line "[=====>    ] 42 % 1.2 MB / 3.0 MB", or the byte count alone
    // when `total` is unknown.
    CLOUDGET_API std::string progress_bar(std::uint64_t done,
                                          std::uint64_t total,
                                          std::size_t width = 50);
}

#endif
