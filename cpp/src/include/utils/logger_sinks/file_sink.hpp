#pragma once

#include "utils/logger_sinks/sink.hpp"

#include <filesystem>
#include <string>

namespace walkie::utils
{

/**
 * @class FileSink
 * @brief Append-only log file, created owner-only (0600) like the rest of the daemon
 * directory.
 */
class WALKIE_UTILS_EXPORT FileSink final : public Sink
{
  public:
    /// @throws std::system_error if the file cannot be opened.
    explicit FileSink(std::filesystem::path path);
    ~FileSink() override;

    FileSink(const FileSink &) = delete;
    FileSink &operator=(const FileSink &) = delete;

    /// @throws std::system_error on a failed write.
    void emit(const LogRecord &record) override;
    void sync() override;
    [[nodiscard]] std::string name() const override { return m_path.string(); }

  private:
    std::filesystem::path m_path;
    int m_fd = -1;
};

} // namespace walkie::utils
