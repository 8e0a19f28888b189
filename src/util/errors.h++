#pragma once
#include "util/common.h++"
#include <stdexcept>

namespace Stowage {
  struct StowageError : public std::runtime_error {
    using std::runtime_error::runtime_error;
  };

  // Configuration and resolution
  struct ConfigError : public StowageError {
    using StowageError::StowageError;
  };
  struct ProviderNotFound : public StowageError {
    std::string provider;
    ProviderNotFound(std::string provider, std::string_view available)
      : StowageError(fmt::format("Provider '{}' not found (available: {})", provider, available)),
        provider(provider) {}
  };
  struct ProviderReturnedInvalid : public StowageError {
    std::string provider;
    ProviderReturnedInvalid(std::string provider)
      : StowageError(fmt::format("Provider '{}' returned null", provider)), provider(provider) {}
  };
  struct TypeMismatch : public StowageError {
    std::string provider;
    TypeMismatch(std::string provider, std::string_view expected)
      : StowageError(fmt::format("Provider '{}' returned a database that is not a {}", provider, expected)),
        provider(provider) {}
  };
  struct MissingProviderKey : public StowageError {
    using StowageError::StowageError;
  };
  struct CallerResolutionFailed : public StowageError {
    using StowageError::StowageError;
  };

  // Entity discovery
  struct ScanIOFailure : public StowageError {
    using StowageError::StowageError;
  };
  struct UnknownTable : public StowageError {
  private:
    std::string _type_name;
  public:
    UnknownTable(std::string type_name, std::string_view reason = "cannot be resolved")
      : StowageError(fmt::format("Table type '{}' {}", type_name, reason)), _type_name(type_name) {}
    auto type_name() const noexcept -> std::string_view { return _type_name; }
  };

  // Backends
  struct BackendConstructionError : public StowageError {
    using StowageError::StowageError;
  };
  struct RowShapeError : public StowageError {
    using StowageError::StowageError;
  };
  struct TransactionError : public StowageError {
    using StowageError::StowageError;
  };

  // Dump
  struct IncompatibleSchemas : public StowageError {
    std::vector<std::string> missing;
    IncompatibleSchemas(std::vector<std::string> missing)
      : StowageError(fmt::format("Destination database does not contain all tables to be dumped (missing: {})", join(missing))),
        missing(missing) {}
  };
  struct TransactionStartFailed : public TransactionError {
    using TransactionError::TransactionError;
  };
  struct TransactionCommitFailed : public TransactionError {
    using TransactionError::TransactionError;
  };
  struct DumpCancelled : public StowageError {
    DumpCancelled() : StowageError("Dump was cancelled before it started") {}
  };
}
