#pragma once

#include "archstore/v1/backup.pb.h"
#include "archstore/v1/integrity.pb.h"
#include "archstore/v1/migration.pb.h"
#include "archstore/v1/snapshot.pb.h"
