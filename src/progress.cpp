#include <algorithm>

#include <spdlog/fmt/fmt.h>

#include <cloudget/progress.hpp>
#include <cloudget/utils.hpp>

namespace cloudget
{
    ProgressTracker::ProgressTracker(std::uint64_t total,
                                     std::size_t transfers,
                                     callback_type callback)
        : m_total(total)
        , m_per_transfer(transfers, 0)
        , m_start(std::chrono::steady_clock::now())
        , m_callback(std::move(callback))
    {
    }

    void ProgressTracker::set_callback(callback_type callback)
    {
        m_callback = std::move(callback);
    }

    void ProgressTracker::reset(std::uint64_t total, std::size_t transfers)
    {
        m_total = total;
        m_done = 0;
        m_per_transfer.assign(transfers, 0);
        m_start = std::chrono::steady_clock::now();
    }

    void ProgressTracker::update(std::size_t index, std::uint64_t transferred)
    {
        if (index >= m_per_transfer.size())
        {
            m_per_transfer.resize(index + 1, 0);
        }
        if (m_per_transfer[index] == transferred)
        {
            return;
        }
        m_done = m_done - m_per_transfer[index] + transferred;
        m_per_transfer[index] = transferred;
        notify();
    }

    void ProgressTracker::restart(std::size_t index)
    {
        update(index, 0);
    }

    std::chrono::steady_clock::duration ProgressTracker::elapsed() const
    {
        return std::chrono::steady_clock::now() - m_start;
    }

    double ProgressTracker::speed() const
    {
        const double seconds = std::chrono::duration<double>(elapsed()).count();
        if (seconds <= 0)
            return 0;
        return static_cast<double>(m_done) / seconds;
    }

    void ProgressTracker::notify()
    {
        if (m_callback)
        {
            m_callback(m_done, m_total);
        }
    }

    std::string progress_bar(std::uint64_t done, std::uint64_t total, std::size_t width)
    {
        if (total == 0)
        {
            return format_bytes(done);
        }

        const double ratio = std::min(1.0, static_cast<double>(done) / static_cast<double>(total));
        const std::size_t pos = static_cast<std::size_t>(static_cast<double>(width) * ratio);

        std::string bar = "[";
        for (std::size_t i = 0; i < width; ++i)
        {
            if (i < pos)
                bar += '=';
            else if (i == pos)
                bar += '>';
            else
                bar += ' ';
        }
        return fmt::format("{}] {} % {} / {}",
                           bar,
                           static_cast<int>(ratio * 100),
                           format_bytes(done),
                           format_bytes(total));
    }
}
