#include "iwscan/interface_locator.hpp"

#include <linux/nl80211.h>
#include <netlink/netlink.h>
#include <netlink/genl/genl.h>
#include <netlink/genl/ctrl.h>
#include <ifaddrs.h>
#include <iostream>

namespace iwscan {

struct InterfaceData {
    std::vector<WirelessInterface>* interfaces;
};

static int interface_handler(struct nl_msg* msg, void* arg) {
    InterfaceData* data = static_cast<InterfaceData*>(arg);
    struct genlmsghdr* gnlh = static_cast<struct genlmsghdr*>(nlmsg_data(nlmsg_hdr(msg)));
    struct nlattr* tb[NL80211_ATTR_MAX + 1];

    nla_parse(tb, NL80211_ATTR_MAX, genlmsg_attrdata(gnlh, 0),
              genlmsg_attrlen(gnlh, 0), NULL);

    if (!tb[NL80211_ATTR_IFNAME]) {
        return NL_SKIP;
    }

    WirelessInterface iface;
    iface.name = nla_get_string(tb[NL80211_ATTR_IFNAME]);
    if (tb[NL80211_ATTR_IFINDEX]) {
        iface.ifindex = nla_get_u32(tb[NL80211_ATTR_IFINDEX]);
    }
    if (tb[NL80211_ATTR_WIPHY]) {
        iface.wiphy = nla_get_u32(tb[NL80211_ATTR_WIPHY]);
    }
    data->interfaces->push_back(iface);

    return NL_SKIP;
}

static int finish_handler(struct nl_msg* msg, void* arg) {
    (void)msg;
    int* ret = static_cast<int*>(arg);
    *ret = 0;
    return NL_SKIP;
}

static int error_handler(struct sockaddr_nl* nla, struct nlmsgerr* err, void* arg) {
    (void)nla;
    int* ret = static_cast<int*>(arg);
    *ret = err->error;
    return NL_STOP;
}

bool looksWireless(const std::string& name) {
    return name.find("wlan") == 0 || name.find("wlp") == 0 ||
           name.find("wlo") == 0 || name.find("wlx") == 0;
}

std::vector<WirelessInterface> InterfaceLocator::listWireless() const {
    std::vector<WirelessInterface> interfaces;

    struct nl_sock* sock = nl_socket_alloc();
    if (!sock) {
        std::cerr << "Failed to allocate netlink socket" << std::endl;
        return interfaces;
    }

    if (genl_connect(sock) < 0) {
        std::cerr << "Failed to connect to generic netlink" << std::endl;
        nl_socket_free(sock);
        return interfaces;
    }

    int nl80211_id = genl_ctrl_resolve(sock, "nl80211");
    if (nl80211_id < 0) {
        std::cerr << "nl80211 not found (kernel might be too old or WiFi not available)" << std::endl;
        nl_close(sock);
        nl_socket_free(sock);
        return interfaces;
    }

    struct nl_msg* msg = nlmsg_alloc();
    if (!msg) {
        std::cerr << "Failed to allocate netlink message" << std::endl;
        nl_close(sock);
        nl_socket_free(sock);
        return interfaces;
    }

    struct nl_cb* cb = nl_cb_alloc(NL_CB_DEFAULT);
    if (!cb) {
        std::cerr << "Failed to allocate netlink callbacks" << std::endl;
        nlmsg_free(msg);
        nl_close(sock);
        nl_socket_free(sock);
        return interfaces;
    }

    genlmsg_put(msg, 0, 0, nl80211_id, 0, NLM_F_DUMP, NL80211_CMD_GET_INTERFACE, 0);

    InterfaceData data = {&interfaces};
    int err = 1;
    nl_cb_set(cb, NL_CB_VALID, NL_CB_CUSTOM, interface_handler, &data);
    nl_cb_err(cb, NL_CB_CUSTOM, error_handler, &err);
    nl_cb_set(cb, NL_CB_FINISH, NL_CB_CUSTOM, finish_handler, &err);

    if (nl_send_auto(sock, msg) < 0) {
        std::cerr << "Failed to send interface dump request" << std::endl;
        err = 0;
    }

    while (err > 0) {
        int rc = nl_recvmsgs(sock, cb);
        if (rc < 0) {
            std::cerr << "Failed to receive netlink messages: " << nl_geterror(rc) << std::endl;
            break;
        }
    }

    if (err < 0) {
        std::cerr << "Interface dump failed with error: " << err << std::endl;
    }

    nl_cb_put(cb);
    nlmsg_free(msg);
    nl_close(sock);
    nl_socket_free(sock);

    return interfaces;
}

std::string InterfaceLocator::findDefault() const {
    std::vector<WirelessInterface> wireless = listWireless();
    if (!wireless.empty()) {
        return wireless.front().name;
    }

    struct ifaddrs *ifaddr, *ifa;
    std::string interface;

    if (getifaddrs(&ifaddr) == -1) {
        std::cerr << "Failed to list network interfaces" << std::endl;
        return "wlan0";
    }

    for (ifa = ifaddr; ifa != NULL; ifa = ifa->ifa_next) {
        if (ifa->ifa_name == NULL) continue;

        std::string name(ifa->ifa_name);
        if (looksWireless(name)) {
            interface = name;
            break;
        }
    }

    freeifaddrs(ifaddr);
    return interface.empty() ? "wlan0" : interface;
}

} // namespace iwscan
