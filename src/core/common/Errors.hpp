#pragma once

#include <QtCore/QString>

namespace Episodic {

struct ResolutionError {
    enum class Kind {
        InvalidPageUrl,
        PageUnreachable,
        PayloadNotFound,
        PayloadMalformed,
        Cancelled
    };

    Kind kind = Kind::PageUnreachable;
    QString detail;
};

struct TransferError {
    enum class Kind {
        Unreachable,
        RangeNotSupported,
        SizeMismatch,
        IOFailure,
        Cancelled
    };

    // Only meaningful for Kind::Unreachable.
    enum class UnreachableReason {
        None,
        Network,
        NotFound,
        UrlExpired,
        HttpStatus
    };

    Kind kind = Kind::Unreachable;
    UnreachableReason reason = UnreachableReason::None;
    int httpStatus = 0;
    QString detail;
};

struct MergeError {
    enum class Kind {
        InputMissing,
        FormatIncompatible,
        ExternalToolFailure,
        Cancelled
    };

    Kind kind = Kind::ExternalToolFailure;
    QString detail;
    QString manifestPath;   // kept on ExternalToolFailure
};

struct SelectionError {
    enum class Kind {
        Empty,
        Malformed
    };

    Kind kind = Kind::Empty;
    QString detail;
};

struct StoreError {
    enum class Kind {
        IOFailure,
        Corrupt,
        InvalidState
    };

    Kind kind = Kind::IOFailure;
    QString detail;
};

QString toString(ResolutionError::Kind kind);
QString toString(TransferError::Kind kind);
QString toString(TransferError::UnreachableReason reason);
QString toString(MergeError::Kind kind);
QString toString(SelectionError::Kind kind);
QString toString(StoreError::Kind kind);

// "<kind>: <detail>" for logs and reports.
QString describe(const ResolutionError& error);
QString describe(const TransferError& error);
QString describe(const MergeError& error);
QString describe(const SelectionError& error);
QString describe(const StoreError& error);

} // namespace Episodic
