// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2022 The Bitcoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <logging.h>

#include <algorithm>
#include <cstdio>

ZKVLog::Logger& LogInstance()
{
    // Never destroyed, so static destructors can still log.
    static ZKVLog::Logger* g_logger{new ZKVLog::Logger()};
    return *g_logger;
}

struct CLogCategoryDesc {
    ZKVLog::LogFlags flag;
    std::string category;
};

const CLogCategoryDesc LogCategories[] =
{
    {ZKVLog::NONE, "0"},
    {ZKVLog::NONE, "none"},
    {ZKVLog::CODEC, "codec"},
    {ZKVLog::VERIFY, "verify"},
    {ZKVLog::ABI, "abi"},
    {ZKVLog::ALL, "1"},
    {ZKVLog::ALL, "all"},
};

bool GetLogCategory(ZKVLog::LogFlags& flag, const std::string& str)
{
    if (str.empty()) {
        flag = ZKVLog::ALL;
        return true;
    }
    for (const CLogCategoryDesc& category_desc : LogCategories) {
        if (category_desc.category == str) {
            flag = category_desc.flag;
            return true;
        }
    }
    return false;
}

void ZKVLog::Logger::EnableCategory(ZKVLog::LogFlags flag)
{
    m_categories |= flag;
}

bool ZKVLog::Logger::EnableCategory(const std::string& str)
{
    ZKVLog::LogFlags flag;
    if (!GetLogCategory(flag, str)) return false;
    EnableCategory(flag);
    return true;
}

void ZKVLog::Logger::DisableCategory(ZKVLog::LogFlags flag)
{
    m_categories &= ~flag;
}

bool ZKVLog::Logger::DisableCategory(const std::string& str)
{
    ZKVLog::LogFlags flag;
    if (!GetLogCategory(flag, str)) return false;
    DisableCategory(flag);
    return true;
}

bool ZKVLog::Logger::WillLogCategory(ZKVLog::LogFlags category) const
{
    return (m_categories.load(std::memory_order_relaxed) & category) != 0;
}

std::string ZKVLog::Logger::LogCategoriesString() const
{
    std::vector<std::string> names;
    for (const CLogCategoryDesc& category_desc : LogCategories) {
        if (category_desc.flag == ZKVLog::NONE || category_desc.flag == ZKVLog::ALL) continue;
        if (WillLogCategory(category_desc.flag)) names.push_back(category_desc.category);
    }
    std::sort(names.begin(), names.end());

    std::string ret;
    for (const std::string& name : names) {
        if (!ret.empty()) ret += ", ";
        ret += name;
    }
    return ret;
}

void ZKVLog::Logger::LogPrintStr(const std::string& str)
{
    std::lock_guard<std::mutex> lock(m_cs);

    if (m_print_to_console) {
        // print to console
        fwrite(str.data(), 1, str.size(), stderr);
        fflush(stderr);
    }
    for (const auto& cb : m_print_callbacks) {
        cb(str);
    }
}
