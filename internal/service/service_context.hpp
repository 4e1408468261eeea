#pragma once

#include <memory>

namespace beatstore::catalog { class FolderSynchronizer; }
namespace beatstore::db { class Repository; }

namespace beatstore::service {

/*
  Dependency container shared by all services.

  Built once by the composition root and passed in; services hold no other
  process-wide state.
*/
struct ServiceContext {
  std::shared_ptr<beatstore::db::Repository> repository;
  std::shared_ptr<beatstore::catalog::FolderSynchronizer> synchronizer;

  // Re-scan the audio folder before every listing.
  bool sync_on_list = true;
};

}
