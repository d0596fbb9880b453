#include "utils/line_framer.hpp"
#include "utils/format_tools.hpp"

namespace walkie::utils
{

LineFramer::Status LineFramer::feed(std::string_view chunk, std::vector<std::string> &lines)
{
    m_buffer.append(chunk.data(), chunk.size());

    size_t start = 0;
    for (size_t nl = m_buffer.find('\n'); nl != std::string::npos; nl = m_buffer.find('\n', start))
    {
        if (nl - start > m_max_buffer)
        {
            reset();
            return Status::Overflow;
        }
        std::string_view line(m_buffer.data() + start, nl - start);
        if (!line.empty() && line.back() == '\r')
        {
            line.remove_suffix(1);
        }
        if (!format_tools::trim_whitespace(line).empty())
        {
            lines.emplace_back(line);
        }
        start = nl + 1;
    }
    m_buffer.erase(0, start);

    // Unterminated tail.
    if (m_buffer.size() > m_max_buffer)
    {
        reset();
        return Status::Overflow;
    }
    return Status::Ok;
}

void LineFramer::reset() noexcept
{
    m_buffer.clear();
    m_buffer.shrink_to_fit();
}

} // namespace walkie::utils
