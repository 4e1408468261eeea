#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/catalog/folder_sync.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/http/router.hpp"
#include "internal/media/audio_library.hpp"
#include "internal/service/catalog_service.hpp"

namespace beatstore::factory {

/*
  Application

  Owns all long-lived objects used by the server and the admin CLI.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository>              repository;
  std::shared_ptr<catalog::FolderSynchronizer> synchronizer;
  std::shared_ptr<service::CatalogService>     catalog_service;
  std::shared_ptr<media::AudioLibrary>         audio_library;
  std::shared_ptr<http::Router>                router;
};

/*
  Build

  Constructs the entire backend based on runtime config. This is the
  composition root: the only place that knows concrete store types.
*/
Application Build(const beatstore::runtime::config::RuntimeConfig& config);

std::shared_ptr<db::Repository> BuildRepository(const beatstore::runtime::config::RuntimeConfig& config);

} // namespace beatstore::factory
