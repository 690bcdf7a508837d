/*
 * Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 * http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#ifndef VOLSCHED_SCHEDULE_PLUGIN_CONSTANTS_H
#define VOLSCHED_SCHEDULE_PLUGIN_CONSTANTS_H
#include <string>

namespace volsched::schedule_plugin {

// plugin name
const std::string VOLUME_RESTRICTIONS_NAME = "VolumeRestrictions";

// cycle state key
const std::string VOLUME_RESTRICTIONS_PRE_FILTER_STATE_KEY = "PreFilter" + VOLUME_RESTRICTIONS_NAME;

// reject reason
const std::string ERR_REASON_DISK_CONFLICT = "node(s) had no available disk";
const std::string ERR_REASON_READ_WRITE_ONCE_POD_CONFLICT =
    "node has pod using PersistentVolumeClaim with the same name and ReadWriteOncePod access mode";

}
#endif  // VOLSCHED_SCHEDULE_PLUGIN_CONSTANTS_H
