#pragma once

#include <string>

// Format a span of simulated seconds compactly.
// Returns strings like "3d4h", "2h35m", "14m22s", "8s", or "-" if negative or not finite.
std::string format_duration(double seconds);

// Format an absolute simulated time as a clock reading: "HH:MM:SS", or
// "Nd HH:MM:SS" once the simulation passes a day. Returns "-" if negative or not finite.
std::string format_sim_time(double seconds);
