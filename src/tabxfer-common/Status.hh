// Copyright 2023 National Technology & Engineering Solutions of Sandia, LLC
// (NTESS). Under the terms of Contract DE-NA0003525 with NTESS, the U.S.
// Government retains certain rights in this software.

#ifndef TABXFER_COMMON_STATUS_HH
#define TABXFER_COMMON_STATUS_HH

#include <cstdint>
#include <memory>
#include <string>

#include <arrow/status.h>


namespace tabxfer {

/**
 * @brief The tabxfer-specific reason behind a failed arrow::Status
 */
enum class ErrorCode : uint8_t {
  None = 0,             //!< Not a tabxfer error (plain arrow status)
  TypeMismatch,         //!< Column data can't be coerced into the declared column type
  SchemaMismatch,       //!< Source column count doesn't match the target table
  InvalidMethod,        //!< Unknown load method literal
  InvalidOption,        //!< Unknown create literal or bad configuration value
  TableExists,          //!< Server refused to create an existing table
  UnsupportedTransport, //!< No way to move the result bytes with the requested mode
  NoDescriptor,         //!< Table wasn't produced by an ipc fetch
  AlreadyReleased,      //!< The table's descriptor was already deallocated
  TransportFailure      //!< The RPC layer reported an error
};
std::string to_string(ErrorCode code);

/**
 * @brief Which step of a connection call produced an error
 */
enum class Phase : uint8_t {
  None = 0,
  Create,
  Load,
  Fetch,
  Release
};
std::string to_string(Phase phase);


/**
 * @brief Detail attached to an arrow::Status so callers can branch on the cause
 */
class ErrorDetail : public arrow::StatusDetail {
public:
  static constexpr const char *kTypeId = "tabxfer::ErrorDetail";

  ErrorDetail(ErrorCode code, Phase phase) : code_(code), phase_(phase) {}

  const char *type_id() const override { return kTypeId; }
  std::string ToString() const override;

  ErrorCode code() const { return code_; }
  Phase phase() const { return phase_; }

private:
  ErrorCode code_;
  Phase phase_;
};

arrow::Status MakeError(ErrorCode code, const std::string &message, Phase phase=Phase::None);

ErrorCode GetErrorCode(const arrow::Status &status);
Phase GetPhase(const arrow::Status &status);
bool IsError(const arrow::Status &status, ErrorCode code);

arrow::Status TagPhase(const arrow::Status &status, Phase phase);

} // namespace tabxfer

#endif // TABXFER_COMMON_STATUS_HH
