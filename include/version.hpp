#pragma once

#define LANSHARE_VERSION "0.1.0"
#define LANSHARE_SERVICE_NAME "lanshare"
