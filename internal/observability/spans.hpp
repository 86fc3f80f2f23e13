#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

namespace mlmeta::runtime::config {
class RuntimeConfig;
}

namespace mlmeta::observability {

// Exports spans over OTLP/gRPC per `config.observability()`. Returns false
// when tracing is disabled in the config or compiled out.
bool InitializeTracing(const mlmeta::runtime::config::RuntimeConfig& config);
void ShutdownTracing();

enum class RequestOutcome {
  kOk,
  // Rejected input: missing field, bad document or patch.
  kRejected,
  kNotFound,
  kBackendError,
  kInternal,
};

constexpr std::string_view OutcomeName(RequestOutcome outcome) {
  switch (outcome) {
    case RequestOutcome::kOk:
      return "ok";
    case RequestOutcome::kRejected:
      return "rejected";
    case RequestOutcome::kNotFound:
      return "not_found";
    case RequestOutcome::kBackendError:
      return "backend_error";
    case RequestOutcome::kInternal:
      return "internal";
  }
  return "internal";
}

/*
  Server span around one MetadataService call.

  Attributes live under "mlmeta.": the project is set on construction, the
  handler adds the store path it touched and how many documents it returned
  or deleted, and Finish() records the outcome. A span that is never
  finished ends as "internal".
*/
class RequestSpan {
 public:
  RequestSpan(std::string_view route, std::string_view project);
  ~RequestSpan();

  RequestSpan(const RequestSpan&)            = delete;
  RequestSpan& operator=(const RequestSpan&) = delete;

  RequestSpan(RequestSpan&&) noexcept;
  RequestSpan& operator=(RequestSpan&&) noexcept;

  void SetPath(std::string_view path);
  void SetDocumentCount(std::int64_t count);
  void SetDeleteCounts(std::int64_t deleted, std::int64_t failed);
  void Finish(RequestOutcome outcome, std::string_view error = {});

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const mlmeta::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline RequestSpan::RequestSpan(std::string_view, std::string_view) {
}

inline RequestSpan::~RequestSpan() {
}

inline RequestSpan::RequestSpan(RequestSpan&&) noexcept = default;

inline RequestSpan& RequestSpan::operator=(RequestSpan&&) noexcept = default;

inline void RequestSpan::SetPath(std::string_view) {
}

inline void RequestSpan::SetDocumentCount(std::int64_t) {
}

inline void RequestSpan::SetDeleteCounts(std::int64_t, std::int64_t) {
}

inline void RequestSpan::Finish(RequestOutcome, std::string_view) {
}
#endif

} // namespace mlmeta::observability
