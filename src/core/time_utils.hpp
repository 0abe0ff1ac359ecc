#pragma once

#include <string>
#include <cstdint>

// Format a Unix timestamp (seconds, fractional) as ISO 8601 UTC:
// "2023-11-14T22:13:20+00:00", or "2023-11-14T22:13:20.250000+00:00"
// when there is a sub-second part.
std::string iso_utc(double epoch_secs);

// ISO 8601 UTC for the current wall-clock time.
std::string now_iso_utc();

// Wall-clock time as fractional seconds since the Unix epoch.
double now_epoch_secs();

// Seconds (fractional) to integer nanoseconds, rounded.
int64_t epoch_to_ns(double epoch_secs);

// Format an elapsed duration in seconds.
// Returns human-readable string like "2h35m", "14m22s", "8s", or "-" if negative.
std::string format_elapsed(double seconds);
