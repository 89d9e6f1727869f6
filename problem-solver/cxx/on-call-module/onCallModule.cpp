/*
 * This source file is part of an OSTIS project. For the latest info, see
 * http://ostis.net Distributed under the MIT License (See accompanying file
 * COPYING.MIT or copy at http://opensource.org/licenses/MIT)
 */

#include "onCallModule.hpp"

#include "agents/exportScheduleCsvAgent.hpp"
#include "agents/importCalendarAgent.hpp"
#include "agents/importTeamAgent.hpp"
#include "agents/onCallScheduleAgent.hpp"

SC_MODULE_REGISTER(OnCallModule)
    ->Agent<ImportTeamAgent>()
    ->Agent<ImportCalendarAgent>()
    ->Agent<OnCallScheduleAgent>()
    ->Agent<ExportScheduleCsvAgent>();
