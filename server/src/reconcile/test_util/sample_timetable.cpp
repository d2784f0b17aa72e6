#include "reconcile/test_util/sample_timetable.h"

#include "log.h"
#include "reconcile/pipeline.h"
#include "wtt/test_util/synthetic_grid.h"

namespace rakelink {

const Timetable& SampleTimetable() {
  static const Timetable* timetable = [] {
    ColumnCells ac = UpWorking("93003 AC", 600, "93004");
    ac[1] = "AC";
    ScheduleGrids grids{
        .up = MakeGrid(
            Direction::kUp,
            UpRows(),
            {UpWorking("93001", 480, "93002"), ac, UpWorking("93005", 700)}
        ),
        .down = MakeGrid(
            Direction::kDown,
            DownRows(),
            {DownWorking("93002", 560), DownWorking("93004", 680),
             DownWorking("93006", 900)}
        ),
    };
    Table summary{{
        {"", "A", "93001", "93002"},
        {"", "B", "93003", "93004"},
    }};
    return new Timetable(BuildTimetable(
        grids, summary, MakeTestDirectory(), TestExtractOptions(), NullLogger()
    ));
  }();
  return *timetable;
}

}  // namespace rakelink
