/*
 * This source file is part of an OSTIS project. For the latest info, see
 * http://ostis.net Distributed under the MIT License (See accompanying file
 * COPYING.MIT or copy at http://opensource.org/licenses/MIT)
 */

#pragma once

#include <sc-memory/sc_addr.hpp>
#include <sc-memory/sc_keynodes.hpp>

class OnCallKeynodes : public ScKeynodes
{
public:
  static inline ScKeynode const action_import_on_call_team{
    "action_import_on_call_team", ScType::ConstNodeClass};
  static inline ScKeynode const action_import_on_call_calendar{
    "action_import_on_call_calendar", ScType::ConstNodeClass};
  static inline ScKeynode const action_build_on_call_schedule{
    "action_build_on_call_schedule", ScType::ConstNodeClass};
  static inline ScKeynode const action_export_on_call_schedule_csv{
    "action_export_on_call_schedule_csv", ScType::ConstNodeClass};

  // Team
  static inline ScKeynode const concept_on_call_member{"concept_on_call_member", ScType::ConstNodeClass};
  static inline ScKeynode const nrel_unavailable_on{"nrel_unavailable_on", ScType::ConstNodeNonRole};

  // Calendar
  static inline ScKeynode const concept_holiday_date{"concept_holiday_date", ScType::ConstNodeClass};
  static inline ScKeynode const concept_patching_date{"concept_patching_date", ScType::ConstNodeClass};

  // Imported file contents
  static inline ScKeynode const nrel_file_content{"nrel_file_content", ScType::ConstNodeNonRole};
  static inline ScKeynode const nrel_holidays_content{"nrel_holidays_content", ScType::ConstNodeNonRole};
  static inline ScKeynode const nrel_patching_content{"nrel_patching_content", ScType::ConstNodeNonRole};
  static inline ScKeynode const nrel_unavailability_content{
    "nrel_unavailability_content", ScType::ConstNodeNonRole};

  // Schedule parameters
  static inline ScKeynode const nrel_start_date{"nrel_start_date", ScType::ConstNodeNonRole};
  static inline ScKeynode const nrel_weeks_count{"nrel_weeks_count", ScType::ConstNodeNonRole};
  static inline ScKeynode const nrel_shuffle_roster{"nrel_shuffle_roster", ScType::ConstNodeNonRole};

  // Schedule structure
  static inline ScKeynode const concept_on_call_schedule{"concept_on_call_schedule", ScType::ConstNodeClass};
  static inline ScKeynode const concept_on_call_week{"concept_on_call_week", ScType::ConstNodeClass};
  static inline ScKeynode const concept_holiday_week{"concept_holiday_week", ScType::ConstNodeClass};
  static inline ScKeynode const concept_patching_week{"concept_patching_week", ScType::ConstNodeClass};
  static inline ScKeynode const concept_unassigned_week{"concept_unassigned_week", ScType::ConstNodeClass};
  static inline ScKeynode const nrel_week_number{"nrel_week_number", ScType::ConstNodeNonRole};
  static inline ScKeynode const nrel_week_start{"nrel_week_start", ScType::ConstNodeNonRole};
  static inline ScKeynode const nrel_week_end{"nrel_week_end", ScType::ConstNodeNonRole};
  static inline ScKeynode const nrel_on_call_member{"nrel_on_call_member", ScType::ConstNodeNonRole};
  static inline ScKeynode const nrel_holiday_weeks_count{"nrel_holiday_weeks_count", ScType::ConstNodeNonRole};
  static inline ScKeynode const nrel_patching_weeks_count{"nrel_patching_weeks_count", ScType::ConstNodeNonRole};

  // Export
  static inline ScKeynode const nrel_csv_export{"nrel_csv_export", ScType::ConstNodeNonRole};
};
