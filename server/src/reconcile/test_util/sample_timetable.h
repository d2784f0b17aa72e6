#pragma once

#include "wtt/timetable.h"

namespace rakelink {

// A reconciled timetable over the synthetic five station line.
//
// Arena: 0 93001 UP, 1 93003 UP AC, 2 93005 UP (no link), 3 93002 DOWN,
// 4 93004 DOWN, 5 93006 DOWN (no link). Links A = 93001 93002 and
// B = 93003 93004, both 120 km.
//
// 93001 leaves VIRAR 08:00, reaches DADAR 08:45 and CHURCHGATE 09:00, and
// reverses at 09:10 as 93002 (DADAR 09:35, VIRAR 10:30). 93003 leaves VIRAR
// 10:00 (DADAR 10:45), 93004 leaves CHURCHGATE 11:20 (DADAR 11:35).
const Timetable& SampleTimetable();

}  // namespace rakelink
