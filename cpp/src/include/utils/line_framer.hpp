#pragma once
/**
 * @file line_framer.hpp
 * @brief Bounded accumulator that splits a byte stream into newline-terminated lines.
 *
 * Used for both framed streams in the daemon: control requests from local clients and
 * wire records from peers. The bound applies to each line, complete or not: a burst of
 * short lines larger than the bound in total is fine, one line longer than the bound
 * overflows whether or not its newline has arrived.
 */
#include "walkie_utils_export.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace walkie::utils
{

class WALKIE_UTILS_EXPORT LineFramer
{
  public:
    enum class Status
    {
        Ok,
        Overflow, ///< A line exceeded the limit; the buffer has been cleared.
    };

    explicit LineFramer(size_t max_buffer) : m_max_buffer(max_buffer) {}

    /**
     * @brief Appends @p chunk and moves every complete line into @p lines.
     *
     * Line terminators ('\n', and a preceding '\r') are stripped; blank lines are skipped.
     * On Overflow, @p lines still holds the lines completed before the oversized one.
     */
    [[nodiscard]] Status feed(std::string_view chunk, std::vector<std::string> &lines);

    [[nodiscard]] size_t buffered() const noexcept { return m_buffer.size(); }
    [[nodiscard]] size_t max_buffer() const noexcept { return m_max_buffer; }
    void clear() noexcept { m_buffer.clear(); }

  private:
    void reset() noexcept;

    size_t m_max_buffer;
    std::string m_buffer;
};

} // namespace walkie::utils
