#ifndef LEDGERERRORS_H
#define LEDGERERRORS_H

#include <QString>
#include <optional>
#include <utility>

/**
 * @brief Failure reported by a ledger operation
 *
 * Validation, Conflict and NotFound leave the ledger unchanged and are meant
 * to be shown to the user. Storage failures are retryable; the operation has
 * been rolled back.
 */
class LedgerError
{
public:
    enum Code {
        None,
        Validation,
        Conflict,
        NotFound,
        Storage
    };

    LedgerError() = default;
    LedgerError(Code code, const QString &message) : m_code(code), m_message(message) {}

    static LedgerError validation(const QString &message) { return LedgerError(Validation, message); }
    static LedgerError conflict(const QString &message) { return LedgerError(Conflict, message); }
    static LedgerError notFound(const QString &message) { return LedgerError(NotFound, message); }
    static LedgerError storage(const QString &message) { return LedgerError(Storage, message); }

    Code code() const { return m_code; }
    QString message() const { return m_message; }
    bool isError() const { return m_code != None; }
    bool isRetryable() const { return m_code == Storage; }

    QString codeName() const
    {
        switch (m_code) {
            case None:       return QStringLiteral("NONE");
            case Validation: return QStringLiteral("VALIDATION_ERROR");
            case Conflict:   return QStringLiteral("CONFLICT");
            case NotFound:   return QStringLiteral("NOT_FOUND");
            case Storage:    return QStringLiteral("STORAGE_ERROR");
        }
        return QStringLiteral("UNKNOWN");
    }

    QString toString() const { return QString("%1: %2").arg(codeName(), m_message); }

private:
    Code m_code = None;
    QString m_message;
};

/**
 * @brief Value of a ledger operation, or the error that prevented it
 */
template<typename T>
class LedgerResult
{
public:
    LedgerResult(T value) : m_value(std::move(value)) {}
    LedgerResult(LedgerError error) : m_error(std::move(error)) {}

    bool isOk() const { return !m_error.isError(); }
    explicit operator bool() const { return isOk(); }

    const T &value() const { return *m_value; }
    T &value() { return *m_value; }
    const LedgerError &error() const { return m_error; }

private:
    std::optional<T> m_value;
    LedgerError m_error;
};

#endif // LEDGERERRORS_H
