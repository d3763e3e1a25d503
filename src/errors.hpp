#pragma once

#include <stdexcept>
#include <string>
#include <utility>

class LedgerError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// File could not be opened, read or stat'ed. Per-path, never fatal.
class IoError : public LedgerError {
public:
  IoError(std::string path, const std::string& reason)
    : LedgerError(path + ": " + reason),
      path_(std::move(path)),
      reason_(reason) {}

  const std::string& path() const { return path_; }
  const std::string& reason() const { return reason_; }

private:
  std::string path_;
  std::string reason_;
};

class PolicyError : public LedgerError {
public:
  PolicyError(std::string path, const std::string& what)
    : LedgerError(what + ": " + path), path_(std::move(path)) {}

  const std::string& path() const { return path_; }

private:
  std::string path_;
};

class AlreadyTrackedError : public PolicyError {
public:
  explicit AlreadyTrackedError(std::string path)
    : PolicyError(std::move(path), "file already tracked") {}
};

class NotTrackedError : public PolicyError {
public:
  explicit NotTrackedError(std::string path)
    : PolicyError(std::move(path), "file is not tracked") {}
};

// The persisted store failed. Aborts the whole invocation.
class StoreError : public LedgerError {
public:
  using LedgerError::LedgerError;
};

class ConfigError : public LedgerError {
public:
  using LedgerError::LedgerError;
};
