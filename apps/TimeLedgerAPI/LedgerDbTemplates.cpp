// File: LedgerDbTemplates.cpp
#include "dbservice/dbservice.hpp"
#include "Repositories/BaseRepository.h"

#include "Models/UserModel.h"
#include "Models/WorkSessionModel.h"
#include "Models/AdjustmentModel.h"
#include "Models/LedgerLogModel.h"

// Explicit template instantiations for each model type
template class DbService<UserModel>;
template class DbService<WorkSessionModel>;
template class DbService<AdjustmentModel>;
template class DbService<LedgerLogModel>;

template class BaseRepository<UserModel>;
template class BaseRepository<WorkSessionModel>;
template class BaseRepository<AdjustmentModel>;
template class BaseRepository<LedgerLogModel>;
