
#include "config.h"

#include "index.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <ranges>
#include <utility>

#include "adapter.hpp"
#include "except.h"
#include "hfstring.h"
#include "logging.h"


namespace hf {

auto DatasetIndex::Build(const FormatAdapter &adapter) -> DatasetIndex
{
    auto entries = adapter.enumerate();
    if(entries.empty())
        throw_error<config_error>("{}: no measurements found under {}",
            GetFormatName(adapter.format()), hf::u8_as_char(adapter.root().u8string()));
    return FromEntries(std::move(entries), adapter.format());
}

auto DatasetIndex::FromEntries(std::vector<IndexEntry> entries, FormatType const format)
    -> DatasetIndex
{
    if(entries.empty())
        throw_error<config_error>("{}: cannot index an empty dataset", GetFormatName(format));

    /* Keys must be totally ordered for the sorted lookups. */
    auto const nonfinite = std::ranges::find_if(entries, [](const IndexEntry &entry)
    {
        auto const &pos = entry.key.position;
        return !std::isfinite(pos.azimuth) || !std::isfinite(pos.elevation)
            || !std::isfinite(pos.distance);
    });
    if(nonfinite != entries.end())
        throw_error<format_error>("{}: non-finite position for {} at {}", GetFormatName(format),
            FormatKey(nonfinite->key), FormatLocator(nonfinite->locator));

    std::ranges::stable_sort(entries, std::less{}, &IndexEntry::key);
    auto const dupe = std::ranges::adjacent_find(entries, std::equal_to{}, &IndexEntry::key);
    if(dupe != entries.end())
        throw_error<format_error>("{}: duplicate measurement {} at {} and {}",
            GetFormatName(format), FormatKey(dupe->key), FormatLocator(dupe->locator),
            FormatLocator(std::next(dupe)->locator));

    TRACE("Indexed {} {} measurements", entries.size(), GetFormatName(format));
    return DatasetIndex{std::make_shared<const std::vector<IndexEntry>>(std::move(entries)),
        format};
}

auto DatasetIndex::keys() const -> std::vector<MeasurementKey>
{
    auto ret = std::vector<MeasurementKey>{};
    ret.reserve(mEntries->size());
    std::ranges::transform(*mEntries, std::back_inserter(ret), &IndexEntry::key);
    return ret;
}

auto DatasetIndex::subjects() const -> std::vector<u32>
{
    auto ret = std::vector<u32>{};
    /* Entries are ordered by subject first. */
    for(const auto &entry : *mEntries)
    {
        if(ret.empty() || ret.back() != entry.key.subject)
            ret.emplace_back(entry.key.subject);
    }
    return ret;
}

auto DatasetIndex::find(const MeasurementKey &key) const noexcept -> const IndexEntry*
{
    auto iter = std::ranges::lower_bound(*mEntries, key, std::less{}, &IndexEntry::key);
    if(iter != mEntries->end() && iter->key == key)
        return &*iter;
    return nullptr;
}

auto DatasetIndex::locator_for(const MeasurementKey &key) const -> const Locator&
{
    if(auto *entry = find(key))
        return entry->locator;
    throw_error<key_error>("{}: no measurement for {}", GetFormatName(mFormat), FormatKey(key));
}

auto DatasetIndex::filter(const SubjectPredicate &subjectPred,
    const PositionPredicate &positionPred, const SidePredicate &sidePred) const -> DatasetIndex
{
    auto accepted = [&](const IndexEntry &entry) -> bool
    {
        return (!subjectPred || subjectPred(entry.key.subject))
            && (!positionPred || positionPred(entry.key.position))
            && (!sidePred || sidePred(entry.key.side));
    };

    auto entries = std::vector<IndexEntry>{};
    std::ranges::copy_if(*mEntries, std::back_inserter(entries), accepted);
    return DatasetIndex{std::make_shared<const std::vector<IndexEntry>>(std::move(entries)),
        mFormat};
}

} // namespace hf
