#pragma once

#include "quill/applier.hpp"
#include "quill/backend.hpp"
#include "quill/change.hpp"
#include "quill/command.hpp"
#include "quill/config.hpp"
#include "quill/context.hpp"
#include "quill/engine.hpp"
#include "quill/errors.hpp"
#include "quill/events.hpp"
#include "quill/format.hpp"
#include "quill/sandbox.hpp"
#include "quill/services.hpp"
#include "quill/utils.hpp"
#include "quill/vcs.hpp"
#include "quill/workspace.hpp"
