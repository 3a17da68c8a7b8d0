#include "covalent/system/directory.hpp"
#include "covalent/system/exception.hpp"
#include "covalent/system/filedevice.hpp"
#include "covalent/system/log.hpp"
#include <cstdlib>
#include <iostream>
#include <string>
#include <sys/types.h>
#include <unistd.h>

using namespace std;

namespace {
covalent::LoggerT logger{"test"};
}

int test_log_file(int argc, char* argv[])
{
    string prefix = "test_log/log_file";

    if (argc > 1) {
        prefix = argv[1];
        prefix += "/log_file";
    }

    int count = 20 * 1000;

    if (argc > 2) {
        count = atoi(argv[2]);
    }

    const string current_path = prefix + ".log";
    const string first_path   = prefix + "_0001.log";
    const string second_path  = prefix + "_0002.log";
    const string third_path   = prefix + "_0003.log";

    covalent::Directory::eraseFile(current_path.c_str());
    covalent::Directory::eraseFile(first_path.c_str());
    covalent::Directory::eraseFile(second_path.c_str());

    const uint64_t respin_size = 256 * 1024;

    auto err = covalent::log_start(prefix.c_str(), {".*:VIEW"}, true, 2, respin_size);

    covalent_check(!err, "Log start error: " << err.message());

    const auto proc_id = getpid();

    for (int i = 0; i < count; ++i) {
        covalent_log(covalent::generic_logger, Info, proc_id << ' ' << i << " First line of log: " << argc << " " << argv[0]);
        covalent_log(logger, Verbose, proc_id << ' ' << i << " Second line of log: " << argc << ' ' << argv[0]);
    }

    covalent::log_stop();

    const auto current_size = covalent::FileDevice::size(current_path.c_str());
    cout << current_path << ": " << current_size << endl;
    covalent_check(current_size > 0, "empty current log file");
    covalent_check(static_cast<uint64_t>(current_size) <= respin_size);
    covalent_check(covalent::FileDevice::size(first_path.c_str()) > 0, "no respin happened");
    covalent_check(covalent::FileDevice::size(second_path.c_str()) > 0, "not enough respins");
    covalent_check(!covalent::Directory::exists(third_path.c_str()), "respin count not honored");

    err = covalent::log_start("", {".*:VIEW"});
    covalent_check(err == covalent::error_log_path);
    return 0;
}
