#pragma once

#include <reelget/download/download-types.hxx>
#include <reelget/download/download-task.hxx>
#include <reelget/download/download-events.hxx>
#include <reelget/download/transfer-engine.hxx>
#include <reelget/download/batch-runner.hxx>
#include <reelget/download/download-manager.hxx>
