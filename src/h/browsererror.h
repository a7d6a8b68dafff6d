#ifndef BROWSERERROR_H
#define BROWSERERROR_H

#include <QMetaType>

enum class BrowserError
{
    None,
    Validation,   // bad path or port
    Io,           // settings file unreadable / unwritable
    Tor,          // spawn failure, readiness timeout, unexpected exit
    State         // operation not valid in the current state
};

Q_DECLARE_METATYPE(BrowserError)

#endif // BROWSERERROR_H
