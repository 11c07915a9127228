#pragma once

#include "upbus/UUri.hpp"
#include "upbus/UPayload.hpp"
#include "upbus/UMessage.hpp"
#include "upbus/Listener.hpp"
#include "upbus/ListenerRegistry.hpp"
#include "upbus/Transport.hpp"
#include "upbus/LocalTransport.hpp"
#include "upbus/UriProvider.hpp"
#include "upbus/communication/SimplePublisher.hpp"
#include "upbus/communication/SimpleNotifier.hpp"
#include "upbus/net/NetworkTransport.hpp"
#include "upbus/app/Config.hpp"
#include "upbus/app/Logger.hpp"
#include "upbus/Exception.hpp"
