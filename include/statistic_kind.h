#pragma once

// Summary statistic used to collapse an ensemble cross-section into one value
enum class StatisticKind { Mean, Median, Mode };
