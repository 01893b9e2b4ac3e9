//===----------------------------------------------------------------------===//
//
// Part of the apicheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// The run has three phases on one worker pool:
//   1. parse every class file and layout document into its own slot;
//   2. serially build the project hierarchy overlay and suppression index,
//      which need every parsed class;
//   3. scan, resolve and filter each unit, appending to the collector.
// The catalog, hierarchy and suppression index are read-only during phase 3,
// so only the collector takes a lock.
//
//===----------------------------------------------------------------------===//

#include "check/ApiChecker.hpp"

#include "check/ClassScanner.hpp"
#include "check/LayoutScanner.hpp"
#include "check/SuppressionIndex.hpp"
#include "check/TypeHierarchy.hpp"
#include "check/VersionResolver.hpp"
#include "check/ViolationCollector.hpp"
#include "classfile/ClassReader.hpp"
#include "classfile/Descriptor.hpp"
#include "support/path_utils.hpp"
#include "support/trace.hpp"
#include "support/worker_pool.hpp"

#include <algorithm>
#include <sstream>
#include <tuple>
#include <utility>

namespace apicheck::check
{
namespace
{

/// Source path reported for @p unit.
std::string sourcePathOf(const CompiledUnit &unit, const classfile::ClassFile &cls)
{
    if (!unit.sourcePath.empty())
        return unit.sourcePath;
    if (!cls.sourceFile.empty())
        return std::string(classfile::packageOf(cls.name)) + cls.sourceFile;
    return unit.artifactPath;
}

} // namespace

ApiChecker::ApiChecker(const catalog::ApiCatalog &catalog, CheckOptions options)
    : catalog_(catalog), options_(std::move(options))
{
}

ScanResult ApiChecker::run(const std::vector<CompiledUnit> &units,
                           const std::vector<ResourceFile> &resources) const
{
    if (options_.trace)
        support::setTraceEnabled(true);

    support::WorkerPool pool(options_.jobs);
    const int declaredMin = options_.minVersion;

    // Phase 1: parse.
    std::vector<std::optional<classfile::ClassFile>> classes(units.size());
    std::vector<std::optional<support::Diag>> unitErrors(units.size());
    std::vector<std::optional<std::vector<Reference>>> layoutRefs(resources.size());
    std::vector<std::optional<support::Diag>> layoutErrors(resources.size());

    for (size_t i = 0; i < units.size(); ++i)
    {
        pool.submit([&, i] {
            const CompiledUnit &unit = units[i];
            auto parsed = unit.contents ? classfile::parseClassFile(*unit.contents, unit.artifactPath)
                                        : classfile::readClassFile(unit.artifactPath);
            if (parsed)
                classes[i] = std::move(parsed.value());
            else
                unitErrors[i] = std::move(parsed).takeError();
        });
    }
    for (size_t i = 0; i < resources.size(); ++i)
    {
        pool.submit([&, i] {
            const ResourceFile &doc = resources[i];
            auto scanned =
                doc.contents ? scanLayout(*doc.contents, doc.path) : scanLayoutFile(doc.path);
            if (scanned)
                layoutRefs[i] = std::move(scanned.value());
            else
                layoutErrors[i] = std::move(scanned).takeError();
        });
    }
    pool.wait();

    // Phase 2: whole-project indices.
    TypeHierarchy hierarchy(catalog_);
    SuppressionIndex suppressions;
    size_t parsedCount = 0;
    for (const auto &cls : classes)
    {
        if (!cls)
            continue;
        hierarchy.addProjectType(*cls);
        suppressions.addClass(*cls);
        ++parsedCount;
    }
    const VersionResolver resolver(hierarchy);

    if (support::traceEnabled())
    {
        std::ostringstream os;
        os << "parsed " << parsedCount << "/" << units.size() << " class files, "
           << resources.size() << " layouts; min version " << declaredMin << " on "
           << pool.size() << " workers";
        support::trace(os.str());
    }

    // Phase 3: scan, resolve, filter.
    ViolationCollector collector;
    const auto filter = [&](std::vector<Reference> refs, size_t unitIndex) {
        std::vector<Violation> found;
        for (auto &ref : refs)
        {
            const auto resolution = resolver.resolve(ref);
            if (!resolution || resolution->required <= declaredMin)
                continue;
            if (suppressions.isSuppressed(ref, kNewApiCheckId))
                continue;
            ref.file = support::relativeTo(ref.file, options_.baseDir);
            Violation v;
            v.reference = std::move(ref);
            v.required = resolution->required;
            v.declaredMin = declaredMin;
            v.displayOwner = resolution->displayOwner;
            v.unitIndex = unitIndex;
            found.push_back(std::move(v));
        }
        if (support::traceEnabled())
        {
            std::ostringstream os;
            os << "unit " << unitIndex << ": " << refs.size() << " references, " << found.size()
               << " violations";
            support::trace(os.str());
        }
        collector.append(std::move(found));
    };

    for (size_t i = 0; i < units.size(); ++i)
    {
        if (!classes[i])
            continue;
        pool.submit([&, i] {
            const classfile::ClassFile &cls = *classes[i];
            filter(scanClassFile(cls, sourcePathOf(units[i], cls)), i);
        });
    }
    for (size_t i = 0; i < resources.size(); ++i)
    {
        if (!layoutRefs[i])
            continue;
        pool.submit([&, i] { filter(std::move(*layoutRefs[i]), units.size() + i); });
    }
    pool.wait();

    ScanResult result;
    result.violations = collector.take();
    sortViolations(result.violations);

    for (size_t i = 0; i < units.size(); ++i)
    {
        if (!unitErrors[i])
            continue;
        result.failedPaths.push_back(units[i].artifactPath);
        unitErrors[i]->loc.file_id = result.sources.addFile(units[i].artifactPath);
        result.diagnostics.report(std::move(*unitErrors[i]));
    }
    for (size_t i = 0; i < resources.size(); ++i)
    {
        if (!layoutErrors[i])
            continue;
        result.failedPaths.push_back(resources[i].path);
        layoutErrors[i]->loc.file_id = result.sources.addFile(resources[i].path);
        result.diagnostics.report(std::move(*layoutErrors[i]));
    }
    return result;
}

ScanResult scan(const std::vector<CompiledUnit> &units,
                const std::vector<ResourceFile> &resources,
                int declaredMin,
                const catalog::ApiCatalog &catalog)
{
    CheckOptions options;
    options.minVersion = declaredMin;
    return ApiChecker(catalog, std::move(options)).run(units, resources);
}

void sortViolations(std::vector<Violation> &violations)
{
    std::sort(violations.begin(), violations.end(), [](const Violation &a, const Violation &b) {
        return std::tie(a.reference.file, a.reference.line, a.unitIndex, a.reference.seq) <
               std::tie(b.reference.file, b.reference.line, b.unitIndex, b.reference.seq);
    });
}

} // namespace apicheck::check
