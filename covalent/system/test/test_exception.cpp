#include "covalent/system/cassert.hpp"
#include "covalent/system/exception.hpp"
#include <iostream>
#include <sstream>

using namespace std;
namespace {

class ErrorCategory : public covalent::ErrorCategoryT {
public:
    ErrorCategory() {}
    const char* name() const noexcept override
    {
        return "test";
    }
    std::string message(int _ev) const override;
};

const ErrorCategory category;

std::string ErrorCategory::message(int _ev) const
{
    std::ostringstream oss;

    oss << "(" << name() << ":" << _ev << "): ";

    switch (_ev) {
    case 0:
        oss << "Success";
        break;
    case 1:
        oss << "Test";
        break;
    default:
        oss << "Unknown";
    };
    return oss.str();
}

const covalent::ErrorConditionT error_test{1, category};

void throw_test_error(const int _value)
{
    covalent_check_error(_value == 0, error_test);
}

} //namespace

int test_exception(int argc, char* argv[])
{
    bool is_ok = false;

    try {
        covalent_check(argc == 0, "some error: " << argc << " " << argv[0]);
    } catch (std::runtime_error& _rerr) {
        is_ok = true;
        const string what = _rerr.what();
        cout << what << endl;
        covalent_check(what.find("(argc == 0) check failed: some error: ") != string::npos, "unexpected what: " << what);
        covalent_check(what.find(__FILE__) != string::npos, "missing file name: " << what);
    }
    covalent_check(is_ok, "covalent_check did not throw");

    is_ok = false;
    try {
        throw_test_error(argc);
    } catch (covalent::RuntimeError& _rerr) {
        is_ok = true;
        const string what = _rerr.what();
        cout << what << endl;
        covalent_check(_rerr.error() == error_test, "wrong condition: " << _rerr.error().message());
        covalent_check(what.find("error_test:" + error_test.message()) != string::npos, "unexpected what: " << what);
    }
    covalent_check(is_ok, "covalent_check_error did not throw");

    is_ok = false;
    try {
        covalent_throw_error_ex(covalent::error_not_implemented, "extra " << 42);
    } catch (covalent::RuntimeError& _rerr) {
        is_ok = true;
        const string what = _rerr.what();
        covalent_check(_rerr.error() == covalent::error_not_implemented);
        covalent_check(what.find("extra 42") != string::npos, "unexpected what: " << what);
    }
    covalent_check(is_ok, "covalent_throw_error_ex did not throw");

    covalent_check(covalent::error_system.message().find("covalent") != string::npos);
    return 0;
}
