#include "PipeWireAudioBackend.hpp"
#include "PipeWireProperties.hpp"
#include "PlatformQueryError.hpp"
#include <boost/log/trivial.hpp>
#include <pipewire/keys.h>
#include <spa/utils/keys.h>
#include <spa/utils/result.h>
#include <spa/utils/string.h>
#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

namespace mos {

namespace {

constexpr int kPortSettleRoundtrips = 4;

int lastError()
{
    return errno > 0 ? -errno : -EIO;
}

bool isAudioDeviceClass(const char* mediaClass)
{
    return mediaClass &&
           (std::strcmp(mediaClass, "Audio/Sink") == 0 ||
            std::strcmp(mediaClass, "Audio/Source") == 0 ||
            std::strcmp(mediaClass, "Audio/Duplex") == 0);
}

void onGlobal(void* data, uint32_t id, uint32_t /*permissions*/,
              const char* type, uint32_t /*version*/,
              const struct spa_dict* props)
{
    auto* view = static_cast<PipeWireAudioBackend::RegistryView*>(data);
    if (!type || !props)
        return;

    if (std::strcmp(type, PW_TYPE_INTERFACE_Node) == 0) {
        if (!isAudioDeviceClass(spa_dict_lookup(props, PW_KEY_MEDIA_CLASS)))
            return;
        view->nodeIds.append(id);
        if (const char* name = spa_dict_lookup(props, PW_KEY_NODE_NAME))
            view->nodeIdByName.insert(QString::fromUtf8(name), id);
    } else if (std::strcmp(type, PW_TYPE_INTERFACE_Port) == 0) {
        const char* nodeId = spa_dict_lookup(props, PW_KEY_NODE_ID);
        const char* direction = spa_dict_lookup(props, PW_KEY_PORT_DIRECTION);
        if (!nodeId || !direction)
            return;

        PipeWireAudioBackend::PortEntry port;
        port.id = id;
        port.nodeId = static_cast<uint32_t>(std::strtoul(nodeId, nullptr, 10));
        port.playback = std::strcmp(direction, "in") == 0;
        port.monitor = spa_atob(spa_dict_lookup(props, PW_KEY_PORT_MONITOR));
        port.channel = QString::fromUtf8(spa_dict_lookup(props, PW_KEY_AUDIO_CHANNEL));
        view->ports.append(port);
    }
}

// Registry proxy plus the view its globals are collected into. Stays
// subscribed while alive, so later roundtrips pick up new objects.
class RegistryScan {
public:
    explicit RegistryScan(PipeWireSession& session)
        : session_(session)
    {
        registry_ = pw_core_get_registry(session.core(), PW_VERSION_REGISTRY, 0);
        if (!registry_)
            return;

        static const struct pw_registry_events registryEvents = {
            .version = PW_VERSION_REGISTRY_EVENTS,
            .global = onGlobal,
        };
        spa_zero(listener_);
        pw_registry_add_listener(registry_, &listener_, &registryEvents, &view_);
    }

    ~RegistryScan()
    {
        if (registry_) {
            spa_hook_remove(&listener_);
            pw_proxy_destroy(reinterpret_cast<struct pw_proxy*>(registry_));
        }
    }

    RegistryScan(const RegistryScan&) = delete;
    RegistryScan& operator=(const RegistryScan&) = delete;

    int collect()
    {
        if (!registry_)
            return -ENOMEM;
        return session_.roundtrip();
    }

    struct pw_registry* registry() const { return registry_; }
    const PipeWireAudioBackend::RegistryView& view() const { return view_; }

private:
    PipeWireSession& session_;
    struct pw_registry* registry_ = nullptr;
    struct spa_hook listener_{};
    PipeWireAudioBackend::RegistryView view_;
};

struct NodeQuery {
    PropertyBuffer props;
    uint32_t playbackPorts = 0;
    bool answered = false;
};

void onNodeInfo(void* data, const struct pw_node_info* info)
{
    auto* query = static_cast<NodeQuery*>(data);
    if (!info)
        return;
    query->props = copyProperties(info->props);
    query->playbackPorts = info->n_input_ports;
    query->answered = true;
}

// Bind the node, wait for its info event and keep an owned copy of the
// property dictionary. The proxy is gone again when this returns.
NodeQuery queryNode(PipeWireSession& session, struct pw_registry* registry, uint32_t nodeId)
{
    NodeQuery query;

    auto* node = static_cast<struct pw_node*>(
        pw_registry_bind(registry, nodeId, PW_TYPE_INTERFACE_Node, PW_VERSION_NODE, 0));
    if (!node)
        throw PlatformQueryError(nodeId, QStringLiteral("node"), lastError());

    static const struct pw_node_events nodeEvents = {
        .version = PW_VERSION_NODE_EVENTS,
        .info = onNodeInfo,
    };
    struct spa_hook listener;
    spa_zero(listener);
    pw_node_add_listener(node, &listener, &nodeEvents, &query);

    int res = session.roundtrip();

    spa_hook_remove(&listener);
    pw_proxy_destroy(reinterpret_cast<struct pw_proxy*>(node));

    if (res < 0)
        throw PlatformQueryError(nodeId, QStringLiteral("node.info"), res);
    if (!query.answered)
        throw PlatformQueryError(nodeId, QStringLiteral("node.info"), -ENODATA);
    return query;
}

// Client-side proxy of an object created through a server factory.
// Records the bound global id or the first error reported for it.
struct ProxyWatch {
    struct pw_proxy* proxy = nullptr;
    struct spa_hook listener{};
    uint32_t boundId = SPA_ID_INVALID;
    int error = 0;
    std::string message;

    explicit ProxyWatch(struct pw_proxy* p)
        : proxy(p)
    {
        static const struct pw_proxy_events proxyEvents = {
            .version = PW_VERSION_PROXY_EVENTS,
            .bound = onBound,
            .error = onError,
        };
        spa_zero(listener);
        pw_proxy_add_listener(proxy, &listener, &proxyEvents, this);
    }

    ~ProxyWatch()
    {
        // Lingering objects stay in the daemon after the proxy is gone.
        spa_hook_remove(&listener);
        pw_proxy_destroy(proxy);
    }

    ProxyWatch(const ProxyWatch&) = delete;
    ProxyWatch& operator=(const ProxyWatch&) = delete;

    static void onBound(void* data, uint32_t globalId)
    {
        static_cast<ProxyWatch*>(data)->boundId = globalId;
    }

    static void onError(void* data, int /*seq*/, int res, const char* msg)
    {
        auto* self = static_cast<ProxyWatch*>(data);
        if (self->error == 0) {
            self->error = res;
            self->message = msg ? msg : "";
        }
    }
};

std::unique_ptr<ProxyWatch> createObject(PipeWireSession& session, const char* factory,
                                         const char* type, uint32_t version,
                                         const PropertyBuffer& props)
{
    auto* proxy = static_cast<struct pw_proxy*>(
        pw_core_create_object(session.core(), factory, type, version, &props->dict, 0));
    if (!proxy)
        return nullptr;
    return std::make_unique<ProxyWatch>(proxy);
}

} // namespace

// ---- Registry view ----

QList<PipeWireAudioBackend::PortEntry> PipeWireAudioBackend::RegistryView::playbackPorts(uint32_t nodeId) const
{
    QList<PortEntry> result;
    for (const auto& port : ports) {
        if (port.nodeId == nodeId && port.playback && !port.monitor)
            result.append(port);
    }
    std::sort(result.begin(), result.end(),
              [](const PortEntry& a, const PortEntry& b) { return a.id < b.id; });
    return result;
}

QList<PipeWireAudioBackend::PortEntry> PipeWireAudioBackend::RegistryView::monitorPorts(uint32_t nodeId) const
{
    QList<PortEntry> result;
    for (const auto& port : ports) {
        if (port.nodeId == nodeId && !port.playback)
            result.append(port);
    }
    std::sort(result.begin(), result.end(),
              [](const PortEntry& a, const PortEntry& b) { return a.id < b.id; });
    return result;
}

// ---- Directory ----

DeviceSnapshot PipeWireAudioBackend::listDevices()
{
    if (!session_.isConnected())
        throw PlatformQueryError(PW_ID_CORE, QStringLiteral("core"), session_.connectError());

    PipeWireSession::Lock lock(session_);

    RegistryScan scan(session_);
    if (int res = scan.collect(); res < 0)
        throw PlatformQueryError(PW_ID_CORE, QStringLiteral("registry"), res);

    // Copy: per-node roundtrips may append late globals to the view.
    const QList<uint32_t> nodeIds = scan.view().nodeIds;

    DeviceSnapshot devices;
    for (uint32_t nodeId : nodeIds) {
        AudioDevice dev;
        dev.id = nodeId;
        {
            NodeQuery query = queryNode(session_, scan.registry(), nodeId);
            dev.name = requireProperty(query.props, nodeId, {PW_KEY_NODE_DESCRIPTION, PW_KEY_NODE_NICK});
            dev.persistentUid = requireProperty(query.props, nodeId, {PW_KEY_NODE_NAME});
            dev.outputChannelCount = query.playbackPorts;
        }

        BOOST_LOG_TRIVIAL(debug) << "PipeWireAudioBackend: device " << dev.id
                                 << " '" << dev.name.toStdString() << "' uid="
                                 << dev.persistentUid.toStdString()
                                 << " out=" << dev.outputChannelCount;
        devices.append(dev);
    }

    return devices;
}

// ---- Aggregate creation ----

QString PipeWireAudioBackend::aggregatePositions(const QList<QList<PortEntry>>& members, bool stacked)
{
    QStringList positions;
    if (stacked) {
        if (members.isEmpty())
            return {};
        for (const auto& port : members.first()) {
            if (port.channel.isEmpty()) {
                positions.clear();
                break;
            }
            positions.append(port.channel);
        }
        if (positions.isEmpty()) {
            for (int i = 0; i < members.first().size(); ++i)
                positions.append(QStringLiteral("AUX%1").arg(i));
        }
    } else {
        int total = 0;
        for (const auto& member : members)
            total += member.size();
        for (int i = 0; i < total; ++i)
            positions.append(QStringLiteral("AUX%1").arg(i));
    }
    return positions.join(',');
}

QList<PipeWireAudioBackend::PortLink> PipeWireAudioBackend::planLinks(
    const QList<PortEntry>& monitors, const QList<QList<PortEntry>>& members, bool stacked)
{
    QList<PortLink> links;

    if (stacked) {
        for (const auto& memberPorts : members) {
            if (memberPorts.isEmpty())
                continue;
            for (int i = 0; i < monitors.size(); ++i) {
                const PortEntry& from = monitors[i];
                auto match = std::find_if(memberPorts.cbegin(), memberPorts.cend(),
                    [&from](const PortEntry& p) {
                        return !from.channel.isEmpty() && p.channel == from.channel;
                    });
                const PortEntry& to = match != memberPorts.cend()
                                          ? *match : memberPorts[i % memberPorts.size()];
                links.append({from, to});
            }
        }
        return links;
    }

    int next = 0;
    for (const auto& memberPorts : members) {
        for (const auto& to : memberPorts) {
            if (next >= monitors.size())
                return links;
            links.append({monitors[next++], to});
        }
    }
    return links;
}

CreateResult PipeWireAudioBackend::createAggregateDevice(const AggregateDeviceSpec& spec)
{
    CreateResult result;
    if (!session_.isConnected()) {
        result.status = session_.connectError();
        return result;
    }

    PipeWireSession::Lock lock(session_);

    // Members are resolved by UID: node ids from the caller's snapshot are
    // not valid across registry bindings.
    RegistryScan scan(session_);
    if (int res = scan.collect(); res < 0) {
        result.status = res;
        return result;
    }

    QList<QList<PortEntry>> memberPorts;
    for (const auto& uid : spec.memberList) {
        auto it = scan.view().nodeIdByName.constFind(uid);
        QList<PortEntry> ports;
        if (it != scan.view().nodeIdByName.cend())
            ports = scan.view().playbackPorts(it.value());
        if (ports.isEmpty()) {
            BOOST_LOG_TRIVIAL(error) << "PipeWireAudioBackend: member '" << uid.toStdString()
                                     << "' has no playback ports";
            result.status = -ENOENT;
            return result;
        }
        memberPorts.append(ports);
    }

    const QString positions = aggregatePositions(memberPorts, spec.isStacked);

    PropertyBuffer nodeProps(pw_properties_new(
        PW_KEY_FACTORY_NAME, "support.null-audio-sink",
        PW_KEY_NODE_NAME, spec.syntheticUid.toUtf8().constData(),
        PW_KEY_NODE_DESCRIPTION, spec.displayName.toUtf8().constData(),
        PW_KEY_MEDIA_CLASS, "Audio/Sink",
        PW_KEY_OBJECT_LINGER, "true",
        PW_KEY_NODE_VIRTUAL, "true",
        PW_KEY_PRIORITY_DRIVER, "1",
        PW_KEY_NODE_WANT_DRIVER, "true",
        SPA_KEY_AUDIO_POSITION, positions.toUtf8().constData(),
        "monitor.channel-volumes", "true",
        "multi_output.members", spec.memberList.join(',').toUtf8().constData(),
        "multi_output.primary", spec.primaryMemberUid.toUtf8().constData(),
        "multi_output.stacked", spec.isStacked ? "true" : "false",
        nullptr));

    auto node = createObject(session_, "adapter", PW_TYPE_INTERFACE_Node, PW_VERSION_NODE, nodeProps);
    if (!node) {
        result.status = lastError();
        return result;
    }

    int res = session_.roundtrip();
    if (res == 0)
        res = node->error;
    if (res == 0 && node->boundId == SPA_ID_INVALID)
        res = -EIO;
    if (res < 0) {
        BOOST_LOG_TRIVIAL(error) << "PipeWireAudioBackend: creating aggregate node failed: "
                                 << spa_strerror(res) << " " << node->message;
        result.status = res;
        return result;
    }

    // The adapter publishes its ports shortly after the node itself.
    const int expectedPorts = positions.count(',') + 1;
    QList<PortEntry> monitors = scan.view().monitorPorts(node->boundId);
    for (int i = 0; i < kPortSettleRoundtrips && monitors.size() < expectedPorts; ++i) {
        if ((res = session_.roundtrip()) < 0) {
            result.status = res;
            return result;
        }
        monitors = scan.view().monitorPorts(node->boundId);
    }
    if (monitors.isEmpty()) {
        BOOST_LOG_TRIVIAL(error) << "PipeWireAudioBackend: aggregate node " << node->boundId
                                 << " published no monitor ports";
        result.status = -ENOENT;
        return result;
    }

    std::vector<std::unique_ptr<ProxyWatch>> links;
    for (const auto& link : planLinks(monitors, memberPorts, spec.isStacked)) {
        PropertyBuffer linkProps(pw_properties_new(PW_KEY_OBJECT_LINGER, "true", nullptr));
        pw_properties_setf(linkProps.get(), PW_KEY_LINK_OUTPUT_NODE, "%u", link.from.nodeId);
        pw_properties_setf(linkProps.get(), PW_KEY_LINK_OUTPUT_PORT, "%u", link.from.id);
        pw_properties_setf(linkProps.get(), PW_KEY_LINK_INPUT_NODE, "%u", link.to.nodeId);
        pw_properties_setf(linkProps.get(), PW_KEY_LINK_INPUT_PORT, "%u", link.to.id);

        auto watch = createObject(session_, "link-factory", PW_TYPE_INTERFACE_Link,
                                  PW_VERSION_LINK, linkProps);
        if (!watch) {
            result.status = lastError();
            return result;
        }
        links.push_back(std::move(watch));
    }

    if ((res = session_.roundtrip()) < 0) {
        result.status = res;
        return result;
    }
    for (const auto& link : links) {
        if (link->error < 0) {
            BOOST_LOG_TRIVIAL(error) << "PipeWireAudioBackend: linking failed: "
                                     << spa_strerror(link->error) << " " << link->message;
            result.status = link->error;
            return result;
        }
    }

    BOOST_LOG_TRIVIAL(debug) << "PipeWireAudioBackend: aggregate node " << node->boundId
                             << " linked with " << links.size() << " links";
    result.deviceId = node->boundId;
    return result;
}

} // namespace mos
