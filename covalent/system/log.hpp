// covalent/system/log.hpp
//
// Copyright (c) 2026 Covalent authors
//
// This file is part of Covalent framework.
//
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt.
//

#pragma once

#include "covalent/system/chunkedstream.hpp"
#include "covalent/system/common.hpp"
#include "covalent/system/error.hpp"
#include <atomic>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace covalent {

using LogAtomicFlagsBackT = unsigned long;
using LogAtomicFlagsT     = std::atomic<LogAtomicFlagsBackT>;

enum struct LogFlags : LogAtomicFlagsBackT {
    Verbose,
    Info,
    Warning,
    Error,
    Statistic,
    Raw,
    Exception,
    LastFlag
};

struct LogCategoryBase {
    virtual ~LogCategoryBase();

    virtual void parse(LogAtomicFlagsBackT& _ror_flags, LogAtomicFlagsBackT& _rand_flags, const std::string& _txt) const = 0;
};

struct LogCategory : public LogCategoryBase {
    static const LogCategory& the();

    const char* flagName(const LogFlags _flag) const
    {
        switch (_flag) {
        case LogFlags::Verbose:
            return "V";
        case LogFlags::Info:
            return "I";
        case LogFlags::Warning:
            return "W";
        case LogFlags::Error:
            return "E";
        case LogFlags::Statistic:
            return "S";
        case LogFlags::Raw:
            return "R";
        case LogFlags::Exception:
            return "X";
        case LogFlags::LastFlag:
            break;
        }
        return "?";
    }

private:
    void parse(LogAtomicFlagsBackT& _ror_flags, LogAtomicFlagsBackT& _rand_flags, const std::string& _txt) const override;
};

struct LogLineBase {
    virtual ~LogLineBase();
    virtual std::ostream& writeTo(std::ostream&) const = 0;
    virtual size_t        size() const                 = 0;
};

namespace impl {

template <size_t Size>
class LogLineStream : public OChunkedStream<Size>, public LogLineBase {
    using BaseStream = OChunkedStream<Size>;

public:
    std::ostream& writeTo(std::ostream& _ros) const override
    {
        return BaseStream::writeTo(_ros);
    }
    size_t size() const override
    {
        return BaseStream::size();
    }
};

} //namespace impl

std::ostream& operator<<(std::ostream& _ros, const LogLineBase& _line);

class LoggerBase : NonCopyable {
    const std::string name_;
    LogAtomicFlagsT   flags_;
    const size_t      idx_;

protected:
    LoggerBase(const std::string& _name, const LogCategoryBase& _rlc);
    ~LoggerBase();

    std::ostream& doLog(std::ostream& _ros, const char* _flag_name, const char* _file, const char* _fnc, int _line) const;
    void          doDone(const LogLineBase& _log_ros) const;

public:
    const std::string& name() const
    {
        return name_;
    }
    void remask(const LogAtomicFlagsBackT _msk)
    {
        flags_.store(_msk);
    }
    LogAtomicFlagsBackT flags() const
    {
        return flags_.load(std::memory_order_relaxed);
    }
};

template <class Flgs = LogFlags, class LogCat = LogCategory>
class Logger : protected LoggerBase {
    const LogCat& rcat_;

public:
    using ThisT = Logger<Flgs, LogCat>;
    using FlagT = Flgs;

    Logger(const std::string& _name)
        : LoggerBase(_name, LogCat::the())
        , rcat_(LogCat::the())
    {
    }

    using LoggerBase::name;

    bool shouldLog(const FlagT _flag) const
    {
        return (flags() & (1UL << static_cast<size_t>(_flag))) != 0;
    }

    std::ostream& log(std::ostream& _ros, const FlagT _flag, const char* _file, const char* _fnc, int _line) const
    {
        return this->doLog(_ros, rcat_.flagName(_flag), _file, _fnc, _line);
    }
    void done(const LogLineBase& _log_ros) const
    {
        doDone(_log_ros);
    }
};

using LoggerT = Logger<>;

extern const LoggerT generic_logger;

extern const ErrorConditionT error_log_file_open;
extern const ErrorConditionT error_log_path;

void log_stop();

struct LogRecorder : NonCopyable {
    virtual ~LogRecorder();

    virtual void recordLine(const LogLineBase& /*_rlog_line*/);
};

struct LogStreamRecorder : LogRecorder {
    std::ostream& ros_;
    LogStreamRecorder(std::ostream& _ros)
        : ros_(_ros)
    {
    }

    void recordLine(const LogLineBase& _rlog_line) override;
};

using LogRecorderPtrT = std::shared_ptr<LogRecorder>;

ErrorConditionT log_start(
    LogRecorderPtrT&&               _rec_ptr,
    const std::vector<std::string>& _rmodule_mask_vec);

ErrorConditionT log_start(
    std::ostream&                   _ros,
    const std::vector<std::string>& _rmodule_mask_vec);

//! Log into files named <prefix>.log, respinning into <prefix>_NNNN.log
/*!
    \param _buffered collect output in memory and write it in larger slices
    \param _respincnt how many respun files to keep (0 means truncate in place)
    \param _respinsize the size above which the current file is respun (0 disables respin)
*/
ErrorConditionT log_start(
    const char*                     _prefix,
    const std::vector<std::string>& _rmodule_mask_vec,
    bool                            _buffered   = true,
    uint32_t                        _respincnt  = 2,
    uint64_t                        _respinsize = 1024 * 1024 * 1024);

} //namespace covalent

#ifndef COVALENT_LOG_BUFFER_SIZE
#define COVALENT_LOG_BUFFER_SIZE 2 * 1024
#endif

#ifdef COVALENT_HAS_DEBUG

#define covalent_dbg(Lgr, Flg, Txt) covalent_log(Lgr, Flg, Txt)

#else

#define covalent_dbg(...)

#endif

#define covalent_log(Lgr, Flg, Txt)                                                           \
    if (Lgr.shouldLog(std::decay_t<decltype(Lgr)>::FlagT::Flg)) {                             \
        covalent::impl::LogLineStream<COVALENT_LOG_BUFFER_SIZE> os;                           \
        Lgr.log(os, std::decay_t<decltype(Lgr)>::FlagT::Flg, __FILE__,                        \
            static_cast<const char*>((COVALENT_FUNCTION_NAME)), __LINE__)                     \
            << Txt << std::endl;                                                              \
        Lgr.done(os);                                                                         \
    }
