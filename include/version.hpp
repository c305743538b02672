#pragma once

#ifndef PIPEVIEW_VERSION
#define PIPEVIEW_VERSION "0.3.0"
#endif
