#include "runtime/memory.hpp"
#include <glog/logging.h>
#include <fstream>
#include <limits>
#include <string>
#include "config.hpp"

namespace grader {
using namespace std;

// 无法读取可用内存时的假设值
const double ASSUMED_AVAILABLE_GB = 4;

memory_check_result evaluate_memory_pressure(double available_gb) {
    memory_check_result result;
    result.available_gb = available_gb;
    if (available_gb < MEMORY_CRITICAL_GB) {
        result.pressure = memory_pressure::CRITICAL;
        result.can_load_runtime = false;
        result.warning = "Your device has very limited memory. The Python runtime may not work properly.";
    } else if (available_gb < MEMORY_LOW_GB) {
        result.pressure = memory_pressure::LOW;
        result.can_load_runtime = true;
        result.warning = "Close other apps first to ensure smooth Python execution.";
    }
    return result;
}

memory_check_result check_memory_pressure() {
    ifstream fin("/proc/meminfo");
    string key;
    while (fin >> key) {
        if (key == "MemAvailable:") {
            int64_t kb = 0;
            if (fin >> kb)
                return evaluate_memory_pressure(kb / (1024.0 * 1024.0));
            break;
        }
        fin.ignore(numeric_limits<streamsize>::max(), '\n');
    }
    LOG(WARNING) << "unable to read MemAvailable from /proc/meminfo, assuming " << ASSUMED_AVAILABLE_GB << "GB";
    return evaluate_memory_pressure(ASSUMED_AVAILABLE_GB);
}

}  // namespace grader
