#ifndef WARDEN_AUDIT_AUDIT_LOG_HPP
#define WARDEN_AUDIT_AUDIT_LOG_HPP
/**
 * @file AuditLog.hpp
 * @brief Append-only audit trail of decisions and enforcement outcomes.
 * @note Linux-only. One JSON object per line.
 *
 * Record kinds:
 *   {"kind":"decision","cycle":..,"ts_ms":..,"pid":..,"device":..,"memory_bytes":..,
 *    "verdict":..,"job":..|null,"reason":..,"confirmed":..,"command":..,
 *    "owner":..|null}
 *   {"kind":"outcome","cycle":..,"ts_ms":..,"pid":..,"device":..,"signal":..,
 *    "status":..,"escalated":..,"dry_run":..,"detail":..}
 *
 * The file is never truncated or rewritten. Each record is made durable
 * (fsync) before append() returns.
 */

#include "src/enforce/inc/Enforcer.hpp"
#include "src/policy/inc/Classifier.hpp"

#include <cstddef> // std::size_t
#include <cstdint> // std::uint64_t
#include <string>
#include <string_view>

namespace warden {

namespace audit {

/* ----------------------------- Constants ----------------------------- */

/// Bytes read from the end of an existing log to recover the last cycle id.
inline constexpr std::size_t CYCLE_RECOVERY_TAIL_BYTES = 64U * 1024U;

/* ----------------------------- AuditSink ----------------------------- */

/**
 * @brief Destination for audit records.
 */
class AuditSink {
public:
  virtual ~AuditSink() = default;

  /**
   * @brief Durably append one record.
   * @param record Single-line JSON object without trailing newline.
   * @return false if the record may not have been persisted.
   */
  [[nodiscard]] virtual bool append(std::string_view record) = 0;

  /// Flush anything buffered to stable storage.
  [[nodiscard]] virtual bool flush() = 0;

  /// Highest cycle id already present in the trail (0 if none).
  [[nodiscard]] virtual std::uint64_t lastCycleId() const noexcept = 0;

  /// Description of the most recent failure.
  [[nodiscard]] virtual const std::string& lastError() const noexcept = 0;
};

/**
 * @brief AuditSink writing JSON Lines to a file opened with O_APPEND.
 */
class FileAuditLog final : public AuditSink {
public:
  explicit FileAuditLog(std::string path);
  ~FileAuditLog() override;

  FileAuditLog(const FileAuditLog&) = delete;
  FileAuditLog& operator=(const FileAuditLog&) = delete;

  /**
   * @brief Open (creating if needed) and recover the last cycle id.
   * @return false with lastError() set if the file cannot be opened.
   */
  [[nodiscard]] bool open();

  [[nodiscard]] bool isOpen() const noexcept { return fd_ >= 0; }
  [[nodiscard]] const std::string& path() const noexcept { return path_; }

  [[nodiscard]] bool append(std::string_view record) override;
  [[nodiscard]] bool flush() override;
  [[nodiscard]] std::uint64_t lastCycleId() const noexcept override { return lastCycleId_; }
  [[nodiscard]] const std::string& lastError() const noexcept override { return lastError_; }

private:
  std::string path_;
  int fd_{-1};
  std::uint64_t lastCycleId_{0};
  std::string lastError_;
};

/* ----------------------------- Records ----------------------------- */

/**
 * @brief Render a decision record.
 * @param cycleId Cycle the decision belongs to.
 * @param timestampMs Wall-clock time of the record.
 * @param decision Decision to render.
 * @return JSON object on one line.
 */
[[nodiscard]] std::string formatDecisionRecord(std::uint64_t cycleId, std::uint64_t timestampMs,
                                               const policy::Decision& decision);

/**
 * @brief Render an outcome record (timestamp taken from the outcome).
 * @param cycleId Cycle the outcome belongs to.
 * @param outcome Enforcement outcome to render.
 * @return JSON object on one line.
 */
[[nodiscard]] std::string formatOutcomeRecord(std::uint64_t cycleId,
                                              const enforce::EnforcementOutcome& outcome);

/**
 * @brief Highest `"cycle":<n>` value in a chunk of log text.
 * @param text Log content (may start mid-line).
 * @return Maximum cycle id found, or 0.
 */
[[nodiscard]] std::uint64_t recoverLastCycleId(std::string_view text) noexcept;

} // namespace audit

} // namespace warden

#endif // WARDEN_AUDIT_AUDIT_LOG_HPP
