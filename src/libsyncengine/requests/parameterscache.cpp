/*
 * FireSync - Desktop
 * Copyright (C) 2023-2025 Infomaniak Network SA
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */
#include "parameterscache.h"
#include "libcommonserver/log/log.h"

#include <log4cplus/loggingmacros.h>

namespace FSC {

std::shared_ptr<ParametersCache> ParametersCache::_instance;

std::shared_ptr<ParametersCache> ParametersCache::instance(const bool isTest) {
    if (!_instance) _instance = std::shared_ptr<ParametersCache>(new ParametersCache(isTest));
    return _instance;
}

ParametersCache::ParametersCache(const bool isTest) {
    _parameters.setExtendedLog(isTest);
}

void ParametersCache::setParameters(const Parameters &parameters) {
    const bool logChanged = parameters.useLog() != _parameters.useLog() || parameters.logLevel() != _parameters.logLevel();
    _parameters = parameters;
    if (!logChanged || !Log::isSet()) return;

    if (!Log::instance()->configure(_parameters.useLog(), _parameters.logLevel())) {
        LOG_WARN(Log::instance()->getLogger(), "Unable to apply log level " << _parameters.logLevel());
    }
}

} // namespace FSC
