// covalent/io/src/configuration.cpp
//
// Copyright (c) 2026 Covalent authors
//
// This file is part of Covalent framework.
//
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt.
//

#include "covalent/io/configuration.hpp"
#include "covalent/system/log.hpp"
#include <cstdlib>
#include <mutex>

namespace covalent {
namespace io {

extern const LoggerT logger;

namespace {

struct Store {
    std::mutex    mtx_;
    Configuration cfg_;

    static Store& the()
    {
        static Store s;
        return s;
    }

private:
    Store()
        : cfg_(Configuration::fromEnvironment())
    {
    }
};

} //namespace

/*static*/ Configuration Configuration::fromEnvironment()
{
    Configuration cfg;

    const char* ptmp = getenv("COVALENT_TEMP_DIR");
    if (ptmp == nullptr || *ptmp == 0) {
        ptmp = getenv("TMPDIR");
    }
    if (ptmp == nullptr || *ptmp == 0) {
        ptmp = "/tmp";
    }
    cfg.temp_dir = ptmp;

    const char* psz = getenv("COVALENT_BLOB_BUFFER_SIZE");
    if (psz != nullptr && *psz != 0) {
        char*                    pend = nullptr;
        const unsigned long long sz   = strtoull(psz, &pend, 10);
        if (*pend == 0 && sz <= UINT32_MAX) {
            cfg.buffer_capacity = static_cast<uint32_t>(sz);
        } else {
            covalent_log(logger, Warning, "ignoring invalid COVALENT_BLOB_BUFFER_SIZE = " << psz);
        }
    }
    return cfg;
}

std::ostream& operator<<(std::ostream& _ros, const Configuration& _rcfg)
{
    _ros << "temp_dir = " << _rcfg.temp_dir << " buffer_capacity = " << _rcfg.buffer_capacity;
    _ros << " wrap_overflow = " << (_rcfg.wrap_overflow == WrapOverflowE::Promote ? "promote" : "fail");
    return _ros;
}

Configuration configuration()
{
    Store&                      rs = Store::the();
    std::lock_guard<std::mutex> lock(rs.mtx_);
    return rs.cfg_;
}

void configure(const Configuration& _rcfg)
{
    Store&                      rs = Store::the();
    std::lock_guard<std::mutex> lock(rs.mtx_);
    rs.cfg_ = _rcfg;
    covalent_log(logger, Info, "io configured: " << _rcfg);
}

} //namespace io
} //namespace covalent
