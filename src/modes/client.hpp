#pragma once

#include <QString>

namespace modes {

    int runPing(quint16 port);
    int runStatus(quint16 port);

    // Send one canvas command with a generated id and print the reply
    int runSend(quint16 port, const QString& type, const QString& paramsJson, int timeoutMs);

} // namespace modes
