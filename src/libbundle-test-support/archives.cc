#include "charx/bundle/tests/archives.hh"
#include "charx/bundle/archive-writer.hh"
#include "charx/bundle/errors.hh"

namespace charx::testing {

std::string makeArchive(const Entries & entries, int level)
{
    BufferEntrySink sink;
    ArchiveWriter writer(sink);
    for (auto & [name, data] : entries)
        writer.write(name, data, level);
    writer.end();
    return std::move(sink.s);
}

StateObject FakeStateContainer::load()
{
    loads++;
    if (!state)
        throw StructuralError("'%s' is corrupt", name);
    return *state;
}

} // namespace charx::testing
