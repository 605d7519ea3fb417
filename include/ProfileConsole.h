#pragma once

#include "Profile.h"

#include <iostream>

class ProfileConsole {
public:
    static void printColumnTable(const DatasetProfile& profile, std::ostream& os = std::cout);
    static void printCorrelationMatrix(const DatasetProfile& profile, std::ostream& os = std::cout);
    static void printDatasetFlags(const DatasetProfile& profile, std::ostream& os = std::cout);

    // All three sections in order.
    static void printSummary(const DatasetProfile& profile, std::ostream& os = std::cout);
};
