#pragma once

#include <stdexcept>
#include <string>
#include <utility>

#include <boost/optional.hpp>

namespace sdbsplit
{

enum class FailureKind
{
    // The store received the request and answered with an error.
    RemoteRejected,

    // The request never reliably reached the store.
    TransportFailure,

    // The store answered, but the answers cannot be reconciled: a count
    // response without a count, or a token chain ending early.
    Inconsistent
};

std::string toString(FailureKind kind);

struct Failure
{
    Failure() { }

    Failure(FailureKind kind, std::string message)
        : kind(kind)
        , message(message)
    { }

    std::string describe() const;

    FailureKind kind = FailureKind::TransportFailure;
    std::string message;

    int httpStatus = 0;
    std::string errorCode;
    std::string requestId;
    std::string query;
};

class StoreError : public std::runtime_error
{
public:
    StoreError(const Failure& failure)
        : std::runtime_error(failure.describe())
        , m_failure(failure)
    { }

    const Failure& failure() const { return m_failure; }
    FailureKind kind() const { return m_failure.kind; }

private:
    Failure m_failure;
};

// The result of one store call: a value, or the failure that prevented it.
// Reading the value of a failed outcome throws a StoreError, so a failure
// can never be mistaken for an empty result.
template<typename T>
class Outcome
{
public:
    Outcome(T value)
        : m_value(std::move(value))
    { }

    Outcome(Failure failure)
        : m_failure(std::move(failure))
    { }

    bool ok() const { return !!m_value; }
    explicit operator bool() const { return ok(); }

    const T& value() const
    {
        if (!m_value) throw StoreError(*m_failure);
        return *m_value;
    }

    T& value()
    {
        if (!m_value) throw StoreError(*m_failure);
        return *m_value;
    }

    const Failure& failure() const
    {
        if (!m_failure) throw std::logic_error("Outcome holds a value");
        return *m_failure;
    }

private:
    boost::optional<T> m_value;
    boost::optional<Failure> m_failure;
};

} // namespace sdbsplit
