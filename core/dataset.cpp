
#include "config.h"

#include "dataset.hpp"

#include <algorithm>
#include <span>
#include <utility>

#include "except.h"
#include "hfstring.h"
#include "hrir_transform.hpp"
#include "logging.h"


namespace hf {

namespace {

auto SelectSubjects(const DatasetIndex &index, const SubjectSelection &selection,
    const std::vector<u32> &defaultExclude) -> std::vector<u32>
{
    auto subjects = index.subjects();
    if(selection.include)
    {
        auto const &include = *selection.include;
        std::erase_if(subjects, [&include](u32 const subject)
        { return std::ranges::find(include, subject) == include.end(); });
    }

    auto const &exclude = selection.exclude ? *selection.exclude : defaultExclude;
    std::erase_if(subjects, [&exclude](u32 const subject)
    { return std::ranges::find(exclude, subject) != exclude.end(); });
    return subjects;
}

/* Keeps the first or last subject left in the subject-ordered entries. */
void PickSubject(std::vector<IndexEntry> &entries, SubjectPick const pick)
{
    if(entries.empty() || pick == SubjectPick::All)
        return;

    auto const subject = (pick == SubjectPick::First) ? entries.front().key.subject
        : entries.back().key.subject;
    std::erase_if(entries, [subject](const IndexEntry &entry)
    { return entry.key.subject != subject; });
}

/* Subjects with measurements for both ears, in ascending order. Entries are
 * ordered by subject first.
 */
auto SubjectsWithBothSides(std::span<const IndexEntry> entries) -> std::vector<u32>
{
    auto ret = std::vector<u32>{};
    auto iter = entries.begin();
    while(iter != entries.end())
    {
        auto const subject = iter->key.subject;
        auto hasLeft = false;
        auto hasRight = false;
        for(;iter != entries.end() && iter->key.subject == subject;++iter)
        {
            if(SourceSide(iter->key.side) == Side::Left)
                hasLeft = true;
            else
                hasRight = true;
        }
        if(hasLeft && hasRight)
            ret.emplace_back(subject);
    }
    return ret;
}

/* Applies the side selection, turning one ear into mirrored stand-ins for
 * the other where requested.
 */
auto SelectSides(std::span<const IndexEntry> entries, SideSelection const sides)
    -> std::vector<IndexEntry>
{
    auto const needBoth = sides == SideSelection::Both || sides == SideSelection::BothLeft
        || sides == SideSelection::BothRight;

    auto const paired = needBoth ? SubjectsWithBothSides(entries) : std::vector<u32>{};

    auto ret = std::vector<IndexEntry>{};
    ret.reserve(entries.size());
    for(const auto &entry : entries)
    {
        if(needBoth && !std::ranges::binary_search(paired, entry.key.subject))
            continue;

        auto const side = SourceSide(entry.key.side);
        switch(sides)
        {
        case SideSelection::Left:
            if(side == Side::Left)
                ret.emplace_back(entry);
            break;
        case SideSelection::Right:
            if(side == Side::Right)
                ret.emplace_back(entry);
            break;
        case SideSelection::Both:
        case SideSelection::Any:
            ret.emplace_back(entry);
            break;
        case SideSelection::BothLeft:
        case SideSelection::AnyLeft:
            if(side == Side::Left)
                ret.emplace_back(entry);
            else
            {
                auto key = MeasurementKey{entry.key.subject, Side::MirroredRight,
                    MirrorPosition(entry.key.position)};
                ret.emplace_back(IndexEntry{key, entry.locator});
            }
            break;
        case SideSelection::BothRight:
        case SideSelection::AnyRight:
            if(side == Side::Right)
                ret.emplace_back(entry);
            else
            {
                auto key = MeasurementKey{entry.key.subject, Side::MirroredLeft,
                    MirrorPosition(entry.key.position)};
                ret.emplace_back(IndexEntry{key, entry.locator});
            }
            break;
        }
    }
    return ret;
}

auto SelectEntries(const FormatAdapter &adapter, const DatasetConfig &config,
    const std::vector<u32> &defaultExclude) -> DatasetIndex
{
    auto const format = adapter.format();
    auto const full = DatasetIndex::Build(adapter);

    auto const subjects = SelectSubjects(full, config.subjects, defaultExclude);
    if(subjects.empty())
        throw_error<config_error>("{}: subject selection under {} matches none of {} subjects",
            GetFormatName(format), hf::u8_as_char(adapter.root().u8string()),
            full.subjects().size());

    auto const bySubject = full.filter([&subjects](u32 const subject)
        { return std::ranges::binary_search(subjects, subject); }, {}, {});

    auto entries = SelectSides(bySubject.entries(), config.sides);
    if(entries.empty())
        throw_error<config_error>("{}: side selection \"{}\" matches no measurements",
            GetFormatName(format), GetSideSelectionName(config.sides));
    PickSubject(entries, config.subjects.pick);

    if(!config.positions.isEmpty())
    {
        std::erase_if(entries, [&config](const IndexEntry &entry)
        { return !config.positions.accepts(entry.key.position); });
        if(entries.empty())
            throw_error<config_error>("{}: position selection matches no measurements",
                GetFormatName(format));
    }

    return DatasetIndex::FromEntries(std::move(entries), format);
}

auto CreateSourceAdapter(const DatasetSource &source) -> FormatAdapterPtr
{
    auto const format = source.format.value_or(source.collection.format);
    return CreateAdapter(format, source.root, source.collection);
}

auto ValidatedConfig(DatasetConfig config) -> std::shared_ptr<const DatasetConfig>
{
    ValidateConfig(config);
    return std::make_shared<const DatasetConfig>(std::move(config));
}

} // namespace

Dataset::Dataset(FormatAdapterPtr adapter, std::shared_ptr<const DatasetConfig> config,
    std::shared_ptr<const Resampler> resampler, DatasetIndex index)
    : mAdapter{std::move(adapter)}, mConfig{std::move(config)}
    , mResampler{std::move(resampler)}, mIndex{std::move(index)}
{ }

Dataset::Dataset(const DatasetSource &source, DatasetConfig config)
    : Dataset{CreateSourceAdapter(source), std::move(config), source.collection.defaultExclude}
{ }

Dataset::Dataset(FormatAdapterPtr adapter, DatasetConfig config,
    std::vector<u32> defaultExclude)
    : mAdapter{std::move(adapter)}, mConfig{ValidatedConfig(std::move(config))}
    , mResampler{std::make_shared<const Resampler>(mConfig->resampler)}
    , mIndex{SelectEntries(*mAdapter, *mConfig, defaultExclude)}
{
    TRACE("Opened {} dataset {}: {} measurements from {} subjects at {}hz",
        GetFormatName(mIndex.format()), hf::u8_as_char(mAdapter->root().u8string()),
        mIndex.size(), mIndex.subjects().size(), mConfig->sampleRate);
}

auto Dataset::get(const MeasurementKey &key) const -> MeasurementRecord
{
    const auto &loc = mIndex.locator_for(key);
    auto record = mAdapter->read(loc);

    auto samples = mResampler->resample(record.samples, record.sampleRate,
        mConfig->sampleRate);
    if(!mConfig->processing.isIdentity())
        samples = ProcessResponse(std::move(samples), mConfig->processing);

    return MeasurementRecord{key, mConfig->sampleRate, std::move(samples)};
}

auto Dataset::at(usize const idx) const -> MeasurementRecord
{
    if(idx >= mIndex.size())
        throw_error<key_error>("{}: measurement {} out of range (size {})",
            GetFormatName(mIndex.format()), idx, mIndex.size());
    return get(mIndex.entries()[idx].key);
}

auto Dataset::subset(const FilterSpec &spec) const -> Dataset
{
    auto index = mIndex.filter(spec.subjects, spec.positions, spec.sides);
    if(index.empty())
        throw_error<config_error>("{}: subset of {} matches no measurements",
            GetFormatName(mIndex.format()), hf::u8_as_char(mAdapter->root().u8string()));
    return Dataset{mAdapter, mConfig, mResampler, std::move(index)};
}

} // namespace hf
