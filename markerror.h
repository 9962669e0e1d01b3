#ifndef MARKERROR_H
#define MARKERROR_H

#include <QString>

enum class MarkErrorKind { None, Validation, NotFound, IO };

struct MarkError {
    MarkErrorKind kind = MarkErrorKind::None;
    QString message;

    bool isError() const { return kind != MarkErrorKind::None; }
};

// Rellena err (si viene) y devuelve false, para usar como `return fail(...)`.
inline bool fail(MarkError* err, MarkErrorKind kind, const QString& message) {
    if (err) { err->kind = kind; err->message = message; }
    return false;
}

inline QString markErrorKindName(MarkErrorKind k) {
    switch (k) {
    case MarkErrorKind::None:       return "none";
    case MarkErrorKind::Validation: return "validation";
    case MarkErrorKind::NotFound:   return "not-found";
    case MarkErrorKind::IO:         return "io";
    }
    return QString();
}

#endif // MARKERROR_H
