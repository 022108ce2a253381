// eligian/registry/registry_loader.hpp - Populates registries from a document's imports
//
#pragma once

#include "eligian/basic/diagnostic.hpp"
#include "eligian/ir/import_graph.hpp"
#include "eligian/registry/asset_loader.hpp"
#include "eligian/registry/registry.hpp"

namespace eligian
{

/**
 * Loads the stylesheets, labels files and locale files a document imports
 * into the registry store and records them in the document map.
 *
 * Each file is resolved against the document's directory, read and parsed.
 * The parsed files and the document map entry are then published together
 * through RegistryStore::publish_document(). Problems are returned as diagnostics:
 * PATH_TRAVERSAL, FILE_NOT_FOUND, INVALID_LABELS_FILE, INVALID_LOCALE_FILE.
 * A file that fails is left out of the document map.
 */
class RegistryLoader
{
public:
  [[nodiscard]] static DiagnosticBag load(
    const ImportGraph & graph, const AssetLoader & loader, RegistryStore & store);
};

}  // namespace eligian
