// covalent/system/src/log.cpp
//
// Copyright (c) 2026 Covalent authors
//
// This file is part of Covalent framework.
//
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt.
//

#include "covalent/system/log.hpp"
#include "covalent/system/directory.hpp"
#include "covalent/system/exception.hpp"
#include "covalent/system/filedevice.hpp"
#include <chrono>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <iostream>
#include <mutex>
#include <regex>
#include <sstream>
#include <thread>

using namespace std;
using namespace std::chrono;

namespace covalent {

std::ostream& operator<<(std::ostream& _ros, const LogLineBase& _line)
{
    return _line.writeTo(_ros);
}

LogLineBase::~LogLineBase() {}

LogRecorder::~LogRecorder() {}

void LogRecorder::recordLine(const LogLineBase& /*_rlog_line*/) {}

void LogStreamRecorder::recordLine(const LogLineBase& _rlog_line)
{
    _rlog_line.writeTo(ros_);
}

namespace {

enum {
    ErrorFileOpenE = 1,
    ErrorPathE
};

class ErrorCategory : public ErrorCategoryT {
public:
    ErrorCategory() {}
    const char* name() const noexcept override
    {
        return "covalent::log";
    }
    std::string message(int _ev) const override;
};

std::string ErrorCategory::message(int _ev) const
{
    std::ostringstream oss;

    oss << "(" << name() << ":" << _ev << "): ";

    switch (_ev) {
    case 0:
        oss << "Success";
        break;
    case ErrorFileOpenE:
        oss << "File Open";
        break;
    case ErrorPathE:
        oss << "Invalid Path";
        break;
    default:
        oss << "Unknown";
        break;
    }
    return oss.str();
}

const ErrorCategory category;

//-----------------------------------------------------------------------------
//  FileRecordBuffer
//-----------------------------------------------------------------------------
// Writes log bytes to a FileDevice. Unbuffered, every write goes straight to
// the device, otherwise bytes are collected and written once the collected
// amount passes the flush threshold.

class FileRecordBuffer : public std::streambuf {
public:
    static constexpr const size_t buffer_capacity = 4096;
    static constexpr const size_t buffer_flush    = 2048;

    FileRecordBuffer(uint64_t& _rsz, const bool _buffered)
        : rsz_(_rsz)
        , buffered_(_buffered)
    {
        if (buffered_) {
            buf_.reserve(buffer_capacity);
        }
    }

    void device(FileDevice&& _udev)
    {
        dev_ = std::move(_udev);
    }

    FileDevice releaseDevice()
    {
        flushBuffer();
        return std::move(dev_);
    }

    bool flushBuffer()
    {
        if (buf_.empty()) {
            return true;
        }
        const bool rv = dev_.writeAll(buf_.data(), buf_.size());
        buf_.clear();
        return rv;
    }

protected:
    int_type overflow(int_type _c) override
    {
        if (_c != traits_type::eof()) {
            const char c = traits_type::to_char_type(_c);
            if (!store(&c, 1)) {
                return traits_type::eof();
            }
        }
        return _c;
    }

    std::streamsize xsputn(const char* _s, std::streamsize _n) override
    {
        if (store(_s, static_cast<size_t>(_n))) {
            return _n;
        }
        return 0;
    }

    int sync() override
    {
        return flushBuffer() ? 0 : -1;
    }

private:
    // the size counts accepted bytes, pending ones included, so respin
    // decisions do not lag behind the buffer
    bool store(const char* _s, const size_t _n)
    {
        rsz_ += _n;
        if (!buffered_ || _n >= buffer_flush) {
            return flushBuffer() && dev_.writeAll(_s, _n);
        }
        buf_.insert(buf_.end(), _s, _s + _n);
        if (buf_.size() >= buffer_flush) {
            return flushBuffer();
        }
        return true;
    }

private:
    uint64_t&         rsz_;
    const bool        buffered_;
    FileDevice        dev_;
    std::vector<char> buf_;
};

void filePath(string& _out, uint32_t _pos, const string& _path, const string& _name)
{
    constexpr size_t bufcp = 64;
    char             buf[bufcp];

    _out = _path;
    _out += _name;

    if (_pos != 0u) {
        snprintf(buf, bufcp, "_%04lu.log", static_cast<unsigned long>(_pos));
    } else {
        snprintf(buf, bufcp, ".log");
    }
    _out += buf;
}

void splitPrefix(string& _path, string& _name, const char* _prefix)
{
    const char* p = strrchr(_prefix, '/');
    if (p == nullptr) {
        _name = _prefix;
    } else {
        _path.assign(_prefix, (p - _prefix) + 1);
        _name = (p + 1);
    }
}

//-----------------------------------------------------------------------------
//  FileRecorder
//-----------------------------------------------------------------------------

struct FileRecorder : LogRecorder {
    uint64_t          current_size_;
    FileRecordBuffer  buf_;
    std::ostream      os_;
    const std::string path_;
    const std::string name_;
    const uint64_t    respin_size_;
    const uint32_t    respin_count_;

    FileRecorder(
        FileDevice&&   _rfd,
        std::string&&  _path,
        std::string&&  _name,
        const uint64_t _respinsize,
        const uint32_t _respincnt,
        const bool     _buffered)
        : current_size_(_rfd.size() > 0 ? _rfd.size() : 0) // continue an existing file
        , buf_(current_size_, _buffered)
        , os_(&buf_)
        , path_(std::move(_path))
        , name_(std::move(_name))
        , respin_size_(_respinsize)
        , respin_count_(_respincnt)
    {
        buf_.device(std::move(_rfd));
    }

    ~FileRecorder() override
    {
        FileDevice fd = buf_.releaseDevice();
        if (fd) {
            fd.flush();
        }
    }

    bool shouldRespin(const size_t _sz) const
    {
        return (respin_size_ != 0u) && respin_size_ < (current_size_ + _sz);
    }

    // <name>.log becomes <name>_0001.log, older files shift up by one and
    // the one past respin_count_ is dropped.
    void doRespin()
    {
        FileDevice fd = buf_.releaseDevice();
        fd.close();
        current_size_ = 0;

        string fname;
        filePath(fname, 0, path_, name_);

        if (respin_count_ == 0) {
            Directory::eraseFile(fname.c_str());
        } else {
            string from_path;
            string to_path;

            filePath(to_path, respin_count_, path_, name_);
            Directory::eraseFile(to_path.c_str());

            for (uint32_t pos = respin_count_; pos > 1; --pos) {
                filePath(from_path, pos - 1, path_, name_);
                filePath(to_path, pos, path_, name_);
                if (Directory::exists(from_path.c_str())) {
                    Directory::renameFile(from_path.c_str(), to_path.c_str());
                }
            }
            filePath(to_path, 1, path_, name_);
            Directory::renameFile(fname.c_str(), to_path.c_str());
        }

        if (!fd.create(fname.c_str(), FileDevice::WriteOnlyE)) {
            cerr << "Cannot create log file: " << fname << ": " << last_system_error().message() << endl;
            covalent_throw("Cannot create log file: " << fname << ": " << last_system_error().message());
        }
        buf_.device(std::move(fd));
    }

    void recordLine(const LogLineBase& _rlog_line) override
    {
        if (shouldRespin(_rlog_line.size())) {
            doRespin();
        }
        _rlog_line.writeTo(os_);
    }
};

//-----------------------------------------------------------------------------
//  Engine
//-----------------------------------------------------------------------------

class Engine {
    struct ModuleStub {
        LoggerBase*            plgr_;
        const LogCategoryBase* plc_;

        ModuleStub(
            LoggerBase*            _plg = nullptr,
            const LogCategoryBase* _plc = nullptr)
            : plgr_(_plg)
            , plc_(_plc)
        {
        }

        bool empty() const
        {
            return plgr_ == nullptr;
        }
        void clear()
        {
            plgr_ = nullptr;
            plc_  = nullptr;
        }
    };

    using StringPairT       = std::pair<string, string>;
    using StringPairVectorT = std::vector<StringPairT>;
    using ModuleVectorT     = std::vector<ModuleStub>;

    mutex             mtx_;
    StringPairVectorT module_mask_vec_;
    ModuleVectorT     module_vec_;
    LogRecorderPtrT   recorder_ptr_;

public:
    static Engine& the()
    {
        static Engine e;
        return e;
    }

    Engine()
        : recorder_ptr_(std::make_shared<LogRecorder>())
    {
    }

    ~Engine()
    {
        close();
    }

    size_t registerLogger(LoggerBase& _rlg, const LogCategoryBase& _rlc);
    void   unregisterLogger(size_t _idx);

    void log(const LogLineBase& _log_ros);

    ErrorConditionT configure(LogRecorderPtrT&& _recorder_ptr, const std::vector<std::string>& _rmodule_mask_vec);

    void close()
    {
        lock_guard<mutex> lock(mtx_);
        recorder_ptr_ = std::make_shared<LogRecorder>();
    }

private:
    void doConfigureMasks(const std::vector<std::string>& _rmodule_mask_vec);
    void doConfigureModule(size_t _idx);
};

size_t Engine::registerLogger(LoggerBase& _rlg, const LogCategoryBase& _rlc)
{
    lock_guard<mutex> lock(mtx_);
    module_vec_.emplace_back(&_rlg, &_rlc);
    const size_t idx = module_vec_.size() - 1;

    doConfigureModule(idx);
    return idx;
}

void Engine::unregisterLogger(const size_t _idx)
{
    lock_guard<mutex> lock(mtx_);
    module_vec_[_idx].clear();
}

void Engine::log(const LogLineBase& _log_ros)
{
    lock_guard<mutex> lock(mtx_);
    recorder_ptr_->recordLine(_log_ros);
}

ErrorConditionT Engine::configure(LogRecorderPtrT&& _recorder_ptr, const std::vector<std::string>& _rmodule_mask_vec)
{
    lock_guard<mutex> lock(mtx_);
    doConfigureMasks(_rmodule_mask_vec);
    recorder_ptr_ = std::move(_recorder_ptr);
    return ErrorConditionT();
}

void Engine::doConfigureMasks(const std::vector<std::string>& _rmodule_mask_vec)
{
    module_mask_vec_.clear();
    for (const auto& msk_str : _rmodule_mask_vec) {
        const size_t off = msk_str.rfind(':');
        if (off != std::string::npos) {
            module_mask_vec_.emplace_back(msk_str.substr(0, off), msk_str.substr(off + 1));
        } else {
            module_mask_vec_.emplace_back(string(), msk_str);
        }
    }

    for (size_t i = 0; i < module_vec_.size(); ++i) {
        if (!module_vec_[i].empty()) {
            doConfigureModule(i);
        }
    }
}

void Engine::doConfigureModule(const size_t _idx)
{
    LogAtomicFlagsBackT msk_or  = 0;
    LogAtomicFlagsBackT msk_and = 0;
    for (const auto& mmp : module_mask_vec_) {
        if (!mmp.first.empty()) {
            const regex rgx(mmp.first);
            if (!regex_match(module_vec_[_idx].plgr_->name(), rgx)) {
                continue;
            }
        }
        LogAtomicFlagsBackT tmp_or_msk  = 0;
        LogAtomicFlagsBackT tmp_and_msk = 0;
        module_vec_[_idx].plc_->parse(tmp_or_msk, tmp_and_msk, mmp.second);
        msk_or |= tmp_or_msk;
        msk_and |= tmp_and_msk;
    }
    module_vec_[_idx].plgr_->remask(msk_or & (~msk_and));
}

// Strips the source path down to covalent/... when the file belongs to the
// library tree, otherwise to the bare file name.
const char* src_file_name(char const* _fname)
{
    const char* pos = strstr(_fname, "covalent/");
    if (pos != nullptr) {
        return pos;
    }
    const char* file_name = strrchr(_fname, '/');
    if (file_name != nullptr) {
        return file_name + 1;
    }
    return _fname;
}

constexpr LogAtomicFlagsBackT flag_bit(const LogFlags _flag)
{
    return 1UL << static_cast<LogAtomicFlagsBackT>(_flag);
}

} // namespace

/*extern*/ const ErrorConditionT error_log_file_open(ErrorFileOpenE, category);
/*extern*/ const ErrorConditionT error_log_path(ErrorPathE, category);

//-----------------------------------------------------------------------------
//  LogCategory
//-----------------------------------------------------------------------------

/*virtual*/ LogCategoryBase::~LogCategoryBase() {}

/*static*/ const LogCategory& LogCategory::the()
{
    static const LogCategory lc;
    return lc;
}

// Upper case letters enable a flag, lower case letters force it off.
void LogCategory::parse(LogAtomicFlagsBackT& _ror_flags, LogAtomicFlagsBackT& _rand_flags, const std::string& _txt) const
{
    for (const auto c : _txt) {
        LogFlags flag;
        switch (c) {
        case 'v':
        case 'V':
            flag = LogFlags::Verbose;
            break;
        case 'i':
        case 'I':
            flag = LogFlags::Info;
            break;
        case 'w':
        case 'W':
            flag = LogFlags::Warning;
            break;
        case 'e':
        case 'E':
            flag = LogFlags::Error;
            break;
        case 's':
        case 'S':
            flag = LogFlags::Statistic;
            break;
        case 'r':
        case 'R':
            flag = LogFlags::Raw;
            break;
        case 'x':
        case 'X':
            flag = LogFlags::Exception;
            break;
        default:
            continue;
        }
        if (c >= 'a' && c <= 'z') {
            _rand_flags |= flag_bit(flag);
        } else {
            _ror_flags |= flag_bit(flag);
        }
    }
}

LoggerBase::LoggerBase(const std::string& _name, const LogCategoryBase& _rlc)
    : name_(_name)
    , flags_(0)
    , idx_(Engine::the().registerLogger(*this, _rlc))
{
}

LoggerBase::~LoggerBase()
{
    flags_ = 0;
    Engine::the().unregisterLogger(idx_);
}

std::ostream& LoggerBase::doLog(std::ostream& _ros, const char* _flag_name, const char* _file, const char* _fnc, int _line) const
{
    constexpr size_t bufsz = 4 * 1024;
    char             buf[bufsz];
    const auto       now   = system_clock::now();
    const time_t     t_now = system_clock::to_time_t(now);
    tm               loctm;
    localtime_r(&t_now, &loctm);

    const int sz = snprintf(
        buf, bufsz,
        "%s[%04u-%02u-%02u %02u:%02u:%02u.%03u][%s][%s:%d %s]",
        _flag_name,
        static_cast<unsigned>(loctm.tm_year + 1900),
        static_cast<unsigned>(loctm.tm_mon + 1),
        static_cast<unsigned>(loctm.tm_mday),
        static_cast<unsigned>(loctm.tm_hour),
        static_cast<unsigned>(loctm.tm_min),
        static_cast<unsigned>(loctm.tm_sec),
        static_cast<unsigned>(time_point_cast<milliseconds>(now).time_since_epoch().count() % 1000),
        name_.c_str(),
        src_file_name(_file),
        _line, _fnc);

    if (sz > 0) {
        _ros.write(buf, sz < static_cast<int>(bufsz) ? sz : static_cast<int>(bufsz) - 1);
    }

    return _ros << "[0x" << std::hex << std::this_thread::get_id() << std::dec << ']' << ' ';
}

void LoggerBase::doDone(const LogLineBase& _log_ros) const
{
    Engine::the().log(_log_ros);
}

//-----------------------------------------------------------------------------
//  log_start
//-----------------------------------------------------------------------------

const LoggerT generic_logger{"*"};

void log_stop()
{
    Engine::the().close();
}

ErrorConditionT log_start(LogRecorderPtrT&& _rec_ptr, const std::vector<std::string>& _rmodule_mask_vec)
{
    return Engine::the().configure(std::move(_rec_ptr), _rmodule_mask_vec);
}

ErrorConditionT log_start(std::ostream& _ros, const std::vector<std::string>& _rmodule_mask_vec)
{
    return Engine::the().configure(std::make_shared<LogStreamRecorder>(_ros), _rmodule_mask_vec);
}

ErrorConditionT log_start(
    const char*                     _prefix,
    const std::vector<std::string>& _rmodule_mask_vec,
    bool                            _buffered,
    uint32_t                        _respincnt,
    uint64_t                        _respinsize)
{
    if (_prefix == nullptr || *_prefix == 0) {
        return error_log_path;
    }

    FileDevice  fd;
    std::string path;
    std::string name;

    splitPrefix(path, name, _prefix);
    if (path.empty()) {
        path = "log/";
    }
    if (name.empty()) {
        return error_log_path;
    }
    Directory::createAll(path.c_str());

    string fpath;
    filePath(fpath, 0, path, name);

    if (!fd.open(fpath.c_str(), FileDevice::WriteOnlyE | FileDevice::CreateE | FileDevice::AppendE)) {
        return error_log_file_open;
    }

    return Engine::the().configure(
        std::make_shared<FileRecorder>(std::move(fd), std::move(path), std::move(name), _respinsize, _respincnt, _buffered),
        _rmodule_mask_vec);
}

} // namespace covalent
