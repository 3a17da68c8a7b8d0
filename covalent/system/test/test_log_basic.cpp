#include "covalent/system/exception.hpp"
#include "covalent/system/log.hpp"
#include <iostream>
#include <sstream>

using namespace std;

namespace {
covalent::LoggerT logger{"test"};
covalent::LoggerT other_logger{"other::module"};
} //namespace

int test_log_basic(int argc, char* argv[])
{
    {
        ostringstream oss;

        covalent::log_start(oss, {".*:VIEW"});

        covalent_log(covalent::generic_logger, Info, "First line of log: " << argc << " " << argv[0]);
        covalent_log(logger, Verbose, "Second line of log: " << argc << ' ' << argv[0]);

        string s{oss.str()};
        covalent_check(!s.empty(), "no log");
        covalent_check(s.find("First line") != string::npos);
        covalent_check(s.find("Second line") != string::npos);
        covalent_check(s.find("[test]") != string::npos, "logger name missing");
        covalent_check(s.find("test_log_basic.cpp") != string::npos, "file name missing");
        cout.write(s.data(), s.size());
    }

    {
        ostringstream oss;

        covalent::log_start(oss, {".*:VI"});

        covalent_log(covalent::generic_logger, Error, "First line of log: " << argc << " " << argv[0]);
        covalent_log(logger, Warning, "Second line of log: " << argc << ' ' << argv[0]);

        string s{oss.str()};
        covalent_check(s.empty(), "some log");
    }

    {
        ostringstream oss;

        covalent::log_start(oss, {".*:VIEW", "test:v"});

        covalent_log(covalent::generic_logger, Info, "First line of log: " << argc << " " << argv[0]);
        covalent_log(logger, Verbose, "HIDDEN - Second line of log: " << argc << ' ' << argv[0]);
        covalent_log(logger, Info, "Second line of log: " << argc << ' ' << argv[0]);

        string s{oss.str()};
        covalent_check(!s.empty(), "no log");
        covalent_check(s.find("HIDDEN") == string::npos, "found HIDDEN");
        cout.write(s.data(), s.size());
    }

    {
        ostringstream oss;

        covalent::log_start(oss, {"other::.*:EW"});

        covalent_log(logger, Error, "HIDDEN test");
        covalent_log(other_logger, Warning, "visible other");
        covalent_log(other_logger, Info, "HIDDEN info");

        string s{oss.str()};
        covalent_check(s.find("HIDDEN") == string::npos, "found HIDDEN");
        covalent_check(s.find("visible other") != string::npos, "missing other");
        covalent_check(s.compare(0, 2, "W[") == 0, "line must start with the flag: " << s);
    }

    {
        ostringstream oss;

        covalent::log_start(oss, {".*:VIEW"});
        covalent::log_stop();

        covalent_log(logger, Error, "after stop");
        covalent_check(oss.str().empty(), "logged after stop");
    }
    return 0;
}
