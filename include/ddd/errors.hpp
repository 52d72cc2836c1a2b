#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include <grpcpp/grpcpp.h>

namespace ddd {

/**
 * Base exception for all errors raised by the building blocks.
 *
 * Every error carries the gRPC status code a transport adapter should
 * answer with, so presentation layers never need to inspect concrete types.
 */
class DomainError : public std::runtime_error {
public:
    DomainError(const std::string& message, grpc::StatusCode status_code)
        : std::runtime_error(message), status_code_(status_code) {}

    grpc::StatusCode status_code() const { return status_code_; }

    grpc::Status to_grpc_status() const {
        return grpc::Status(status_code_, what());
    }

    /**
     * Returns true if a repository had no aggregate under the requested id.
     */
    virtual bool is_not_found() const { return false; }

    /**
     * Returns true if an optimistic-concurrency check failed.
     */
    virtual bool is_conflict() const { return false; }

    /**
     * Returns true if a mutation was rejected by the aggregate.
     */
    virtual bool is_invariant_violation() const { return false; }

    /**
     * Returns true if a unit of work was used after its terminal transition.
     */
    virtual bool is_invalid_state() const { return false; }

    /**
     * Returns true if event handlers failed after a successful commit.
     * Such an error never implies the commit must be undone.
     */
    virtual bool is_dispatch_failure() const { return false; }

    /**
     * Returns true if a commit was cancelled before it completed.
     */
    virtual bool is_cancelled() const { return false; }

    /**
     * Returns true if the caller passed an unusable argument.
     */
    virtual bool is_invalid_argument() const { return false; }

private:
    grpc::StatusCode status_code_;
};

/**
 * Thrown when a repository has no aggregate with the given id.
 */
class NotFoundError : public DomainError {
public:
    explicit NotFoundError(const std::string& message)
        : DomainError(message, grpc::StatusCode::NOT_FOUND) {}

    bool is_not_found() const override { return true; }
};

/**
 * Thrown when the persisted version differs from the version the aggregate
 * was loaded at.
 */
class ConflictError : public DomainError {
public:
    ConflictError(const std::string& message, std::uint64_t expected_version,
                  std::uint64_t actual_version)
        : DomainError(message, grpc::StatusCode::ABORTED),
          expected_version_(expected_version),
          actual_version_(actual_version) {}

    /** Version the writer believed was persisted. */
    std::uint64_t expected_version() const { return expected_version_; }

    /** Version the store actually holds. */
    std::uint64_t actual_version() const { return actual_version_; }

    bool is_conflict() const override { return true; }

private:
    std::uint64_t expected_version_;
    std::uint64_t actual_version_;
};

/**
 * Thrown by run_in_unit_of_work when a conflict struck after other
 * aggregates of the same commit were already written. Those writes stand,
 * so the use-case is not retried.
 */
class PartialCommitError : public ConflictError {
public:
    PartialCommitError(const ConflictError& cause, std::vector<std::string> saved)
        : ConflictError(describe(cause, saved), cause.expected_version(),
                        cause.actual_version()),
          saved_(std::move(saved)) {}

    /** Keys ("type#id") written before the conflict, in save order. */
    const std::vector<std::string>& saved() const { return saved_; }

private:
    static std::string describe(const ConflictError& cause,
                                const std::vector<std::string>& saved) {
        std::string message = std::string(cause.what()) + " after saving";
        for (const auto& key : saved) {
            message += " " + key;
        }
        return message;
    }

    std::vector<std::string> saved_;
};

/**
 * Thrown when a mutation is rejected by business rules.
 * The aggregate is left exactly as it was before the call.
 */
class InvariantViolationError : public DomainError {
public:
    explicit InvariantViolationError(const std::string& message)
        : DomainError(message, grpc::StatusCode::FAILED_PRECONDITION) {}

    bool is_invariant_violation() const override { return true; }
};

/**
 * Thrown when a unit of work is used after commit or rollback.
 */
class InvalidStateError : public DomainError {
public:
    explicit InvalidStateError(const std::string& message)
        : DomainError(message, grpc::StatusCode::FAILED_PRECONDITION) {}

    bool is_invalid_state() const override { return true; }
};

/**
 * Thrown when an invalid argument is provided.
 */
class InvalidArgumentError : public DomainError {
public:
    explicit InvalidArgumentError(const std::string& message)
        : DomainError(message, grpc::StatusCode::INVALID_ARGUMENT) {}

    bool is_invalid_argument() const override { return true; }
};

/**
 * One failed handler invocation.
 */
struct HandlerFailure {
    std::string event_id;
    std::string event_type;
    std::string handler;
    std::string message;
};

/**
 * Thrown after delivery when one or more handlers failed.
 *
 * Persistence has already succeeded when this is raised.
 */
class DispatchFailureError : public DomainError {
public:
    explicit DispatchFailureError(std::vector<HandlerFailure> failures)
        : DomainError(describe(failures), grpc::StatusCode::INTERNAL),
          failures_(std::move(failures)) {}

    const std::vector<HandlerFailure>& failures() const { return failures_; }

    bool is_dispatch_failure() const override { return true; }

private:
    static std::string describe(const std::vector<HandlerFailure>& failures) {
        std::string message = std::to_string(failures.size()) + " event handler(s) failed";
        if (!failures.empty()) {
            message += "; first: " + failures.front().handler + " on " +
                       failures.front().event_type + ": " + failures.front().message;
        }
        return message;
    }

    std::vector<HandlerFailure> failures_;
};

/**
 * Thrown when a commit observes cancellation.
 *
 * saved() lists the aggregates ("type#id") whose save definitively completed
 * before cancellation was seen; their events were not dispatched.
 */
class CommitCancelledError : public DomainError {
public:
    explicit CommitCancelledError(std::vector<std::string> saved)
        : DomainError("commit cancelled after " + std::to_string(saved.size()) +
                          " completed save(s)",
                      grpc::StatusCode::CANCELLED),
          saved_(std::move(saved)) {}

    const std::vector<std::string>& saved() const { return saved_; }

    bool is_cancelled() const override { return true; }

private:
    std::vector<std::string> saved_;
};

} // namespace ddd
