// Copyright 2023 National Technology & Engineering Solutions of Sandia, LLC
// (NTESS). Under the terms of Contract DE-NA0003525 with NTESS, the U.S.
// Government retains certain rights in this software.

#include <cstring>

#include "tabxfer-common/Status.hh"

using namespace std;

namespace tabxfer {

constexpr const char *ErrorDetail::kTypeId;

string to_string(ErrorCode code) {
  switch(code) {
    case ErrorCode::None:                 return "None";
    case ErrorCode::TypeMismatch:         return "TypeMismatch";
    case ErrorCode::SchemaMismatch:       return "SchemaMismatch";
    case ErrorCode::InvalidMethod:        return "InvalidMethod";
    case ErrorCode::InvalidOption:        return "InvalidOption";
    case ErrorCode::TableExists:          return "TableExists";
    case ErrorCode::UnsupportedTransport: return "UnsupportedTransport";
    case ErrorCode::NoDescriptor:         return "NoDescriptor";
    case ErrorCode::AlreadyReleased:      return "AlreadyReleased";
    case ErrorCode::TransportFailure:     return "TransportFailure";
  }
  return "Unknown("+std::to_string(static_cast<int>(code))+")";
}

string to_string(Phase phase) {
  switch(phase) {
    case Phase::None:    return "None";
    case Phase::Create:  return "Create";
    case Phase::Load:    return "Load";
    case Phase::Fetch:   return "Fetch";
    case Phase::Release: return "Release";
  }
  return "Unknown("+std::to_string(static_cast<int>(phase))+")";
}

string ErrorDetail::ToString() const {
  if(phase_==Phase::None) return to_string(code_);
  return to_string(code_)+" during "+to_string(phase_);
}

namespace {

/// Pick the closest arrow code so generic arrow callers still see something sensible
arrow::StatusCode arrowCodeFor(ErrorCode code) {
  switch(code) {
    case ErrorCode::TypeMismatch:         return arrow::StatusCode::TypeError;
    case ErrorCode::UnsupportedTransport: return arrow::StatusCode::NotImplemented;
    case ErrorCode::NoDescriptor:         return arrow::StatusCode::KeyError;
    case ErrorCode::TransportFailure:     return arrow::StatusCode::IOError;
    case ErrorCode::None:                 return arrow::StatusCode::UnknownError;
    default:                              return arrow::StatusCode::Invalid;
  }
}

const ErrorDetail * findDetail(const arrow::Status &status) {
  if(status.ok()) return nullptr;
  const auto &detail = status.detail();
  if(!detail) return nullptr;
  if(strcmp(detail->type_id(), ErrorDetail::kTypeId)!=0) return nullptr;
  return static_cast<const ErrorDetail *>(detail.get());
}

} // namespace

/**
 * @brief Build a failed status carrying a tabxfer ErrorDetail
 * @param[in] code The tabxfer cause
 * @param[in] message Human readable text
 * @param[in] phase Which step of the call failed (optional)
 * @return A non-ok arrow::Status
 */
arrow::Status MakeError(ErrorCode code, const string &message, Phase phase) {
  return arrow::Status(arrowCodeFor(code), message, make_shared<ErrorDetail>(code, phase));
}

/// @brief Get the tabxfer cause of a status, or ErrorCode::None if it has none
ErrorCode GetErrorCode(const arrow::Status &status) {
  auto *detail = findDetail(status);
  return (detail) ? detail->code() : ErrorCode::None;
}

/// @brief Get the phase recorded on a status, or Phase::None if it has none
Phase GetPhase(const arrow::Status &status) {
  auto *detail = findDetail(status);
  return (detail) ? detail->phase() : Phase::None;
}

bool IsError(const arrow::Status &status, ErrorCode code) {
  return (!status.ok()) && (GetErrorCode(status)==code);
}

/**
 * @brief Stamp a phase on a failed status
 * @param[in] status The status to tag (ok statuses are passed through)
 * @param[in] phase The phase to record
 * @return The tagged status
 * @note Statuses without a tabxfer detail came from the RPC layer. They become
 *       TransportFailure, keeping their arrow code and message verbatim.
 */
arrow::Status TagPhase(const arrow::Status &status, Phase phase) {
  if(status.ok()) return status;
  auto *detail = findDetail(status);
  ErrorCode code = (detail) ? detail->code() : ErrorCode::TransportFailure;
  return status.WithDetail(make_shared<ErrorDetail>(code, phase));
}

} // namespace tabxfer
