#pragma once

#include <string>
#include <cstdint>

// Milliseconds since the Unix epoch (system clock).
int64_t now_epoch_ms();

// Format epoch milliseconds as an ISO 8601 UTC timestamp (YYYY-MM-DDTHH:MM:SSZ).
std::string format_iso_utc(int64_t epoch_ms);

// Number of days in the given month (1-12), leap years included.
int days_in_month(int year, int month);

// Position within the current local calendar month.
struct MonthProgress {
    int day = 1;              // 1-based day of month
    int days_in_month = 30;
};

MonthProgress current_month_progress();
