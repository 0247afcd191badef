#pragma once

#include "../common/Config.hpp"

#include <QCoreApplication>

namespace modes {

    int runServe(QCoreApplication& app, const canvas::RelayConfig& config);

} // namespace modes
