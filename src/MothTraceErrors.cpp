#include "MothTraceErrors.hpp"
#include <iostream>

using namespace std;

namespace MothTrace {

void warnAmbiguousRegionOrdering(const string& stage, size_t found, size_t expected) {
    cerr << "[WARN] AmbiguousRegionOrdering in " << stage << ": expected " << expected
         << " regions, found " << found << "; using the available ones" << endl;
}

} // namespace MothTrace
