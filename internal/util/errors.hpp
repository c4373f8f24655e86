#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace doccat::util {

/*
  Central error types.

  Generation and teardown errors abort the current step; the caller
  (doccatctl) maps them to exit codes.
*/

class MetadataNotFound : public std::runtime_error {
 public:
  explicit MetadataNotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class KeyShapeViolation : public std::runtime_error {
 public:
  explicit KeyShapeViolation(const std::string& msg) : std::runtime_error(msg) {
  }
};

class TeardownBlocked : public std::runtime_error {
 public:
  TeardownBlocked(const std::string& object, std::vector<std::string> blockers)
      : std::runtime_error(Describe(object, blockers)), object_(object), blockers_(std::move(blockers)) {
  }

  const std::string& Object() const {
    return object_;
  }

  const std::vector<std::string>& Blockers() const {
    return blockers_;
  }

 private:
  static std::string Describe(const std::string& object, const std::vector<std::string>& blockers) {
    std::string msg = "cannot drop " + object + ": still referenced by";
    for (const auto& blocker : blockers) {
      msg += " " + blocker;
    }
    return msg;
  }

  std::string              object_;
  std::vector<std::string> blockers_;
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  Import commits one kind at a time. When a kind fails, the kinds listed in
  Committed() stay refreshed and the failed kind keeps its previous rows.
*/
class ImportAborted : public std::runtime_error {
 public:
  ImportAborted(std::string failed_kind, std::vector<std::string> committed, const std::string& cause)
      : std::runtime_error("import aborted at " + failed_kind + " (" + std::to_string(committed.size()) +
                           " kinds already committed): " + cause),
        failed_kind_(std::move(failed_kind)),
        committed_(std::move(committed)) {
  }

  const std::string& FailedKind() const {
    return failed_kind_;
  }

  const std::vector<std::string>& Committed() const {
    return committed_;
  }

 private:
  std::string              failed_kind_;
  std::vector<std::string> committed_;
};

} // namespace doccat::util
