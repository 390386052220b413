#include "scan_backend.hpp"

// Built when no accelerated scan engine was found at configure time.
// The scanner treats a null backend as "use the reference path".

namespace phiscan {
namespace scanner {

std::unique_ptr<ScanBackend> makeAcceleratedScanBackend(std::shared_ptr<const PatternList> /*patterns*/)
{
    return nullptr;
}

bool acceleratedScanCompiledIn()
{
    return false;
}

} // namespace scanner
} // namespace phiscan
