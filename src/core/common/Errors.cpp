#include "Errors.hpp"

namespace Episodic {

namespace {

QString join(const QString& kind, const QString& detail) {
    return detail.isEmpty() ? kind : QString("%1: %2").arg(kind, detail);
}

} // namespace

QString toString(ResolutionError::Kind kind) {
    switch (kind) {
        case ResolutionError::Kind::InvalidPageUrl: return "InvalidPageUrl";
        case ResolutionError::Kind::PageUnreachable: return "PageUnreachable";
        case ResolutionError::Kind::PayloadNotFound: return "PayloadNotFound";
        case ResolutionError::Kind::PayloadMalformed: return "PayloadMalformed";
        case ResolutionError::Kind::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

QString toString(TransferError::Kind kind) {
    switch (kind) {
        case TransferError::Kind::Unreachable: return "Unreachable";
        case TransferError::Kind::RangeNotSupported: return "RangeNotSupported";
        case TransferError::Kind::SizeMismatch: return "SizeMismatch";
        case TransferError::Kind::IOFailure: return "IOFailure";
        case TransferError::Kind::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

QString toString(TransferError::UnreachableReason reason) {
    switch (reason) {
        case TransferError::UnreachableReason::None: return "None";
        case TransferError::UnreachableReason::Network: return "Network";
        case TransferError::UnreachableReason::NotFound: return "NotFound";
        case TransferError::UnreachableReason::UrlExpired: return "UrlExpired";
        case TransferError::UnreachableReason::HttpStatus: return "HttpStatus";
    }
    return "Unknown";
}

QString toString(MergeError::Kind kind) {
    switch (kind) {
        case MergeError::Kind::InputMissing: return "InputMissing";
        case MergeError::Kind::FormatIncompatible: return "FormatIncompatible";
        case MergeError::Kind::ExternalToolFailure: return "ExternalToolFailure";
        case MergeError::Kind::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

QString toString(SelectionError::Kind kind) {
    switch (kind) {
        case SelectionError::Kind::Empty: return "Empty";
        case SelectionError::Kind::Malformed: return "Malformed";
    }
    return "Unknown";
}

QString toString(StoreError::Kind kind) {
    switch (kind) {
        case StoreError::Kind::IOFailure: return "IOFailure";
        case StoreError::Kind::Corrupt: return "Corrupt";
        case StoreError::Kind::InvalidState: return "InvalidState";
    }
    return "Unknown";
}

QString describe(const ResolutionError& error) {
    return join(toString(error.kind), error.detail);
}

QString describe(const TransferError& error) {
    QString kind = toString(error.kind);
    if (error.kind == TransferError::Kind::Unreachable &&
        error.reason != TransferError::UnreachableReason::None) {
        kind += "/" + toString(error.reason);
    }
    if (error.httpStatus > 0) {
        kind += QString(" (HTTP %1)").arg(error.httpStatus);
    }
    return join(kind, error.detail);
}

QString describe(const MergeError& error) {
    return join(toString(error.kind), error.detail);
}

QString describe(const SelectionError& error) {
    return join(toString(error.kind), error.detail);
}

QString describe(const StoreError& error) {
    return join(toString(error.kind), error.detail);
}

} // namespace Episodic
