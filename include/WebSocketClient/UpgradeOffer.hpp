#ifndef WEB_SOCKET_CLIENT_UPGRADE_OFFER_HPP
#define WEB_SOCKET_CLIENT_UPGRADE_OFFER_HPP

/**
 * @file UpgradeOffer.hpp
 *
 * This module declares the WebSocketClient::UpgradeOffer class and
 * the functions used to answer an upgrade request as a server.
 *
 * © 2018 by Richard Walters
 */

#include <Http/Request.hpp>
#include <Http/Response.hpp>
#include <string>
#include <SystemAbstractions/CryptoRandom.hpp>

namespace WebSocketClient {

    /**
     * This represents the client's offer to switch an HTTP connection
     * over to the WebSocket protocol.  It decorates the HTTP request
     * with the upgrade headers, and checks that the server's response
     * properly accepts the offer.
     */
    class UpgradeOffer {
        // Public methods
    public:
        /**
         * This constructs an offer with a freshly generated key.
         *
         * @param[in] rng
         *     This is used to generate the key.
         */
        explicit UpgradeOffer(SystemAbstractions::CryptoRandom& rng);

        /**
         * This constructs an offer with the given key.
         *
         * @param[in] key
         *     This is the Base64 encoded value to send in the
         *     "Sec-WebSocket-Key" header.
         */
        explicit UpgradeOffer(const std::string& key);

        /**
         * This method returns the value sent in the
         * "Sec-WebSocket-Key" header.
         *
         * @return
         *     The key is returned.
         */
        const std::string& GetKey() const;

        /**
         * This method adds the headers that ask the server to upgrade
         * the connection to the given request.
         *
         * @param[in,out] request
         *     This is the request to decorate.
         */
        void Apply(Http::Request& request) const;

        /**
         * This method checks whether or not the given response
         * accepts the offer.
         *
         * @param[in] response
         *     This is the response received from the server.
         *
         * @return
         *     An indication of whether or not the server accepted
         *     the offer is returned.
         */
        bool Accepts(const Http::Response& response) const;

        // Private properties
    private:
        /**
         * This is the Base64 encoded randomly-generated data set for
         * the Sec-WebSocket-Key header.
         */
        std::string key_;
    };

    /**
     * This function computes the value of the "Sec-WebSocket-Accept"
     * HTTP response header that matches the given value of the
     * "Sec-WebSocket-Key" HTTP request header.
     *
     * @param[in] key
     *     This is the key value for which to compute the matching answer.
     *
     * @return
     *     The answer computed from the given key is returned.
     */
    std::string ComputeKeyAnswer(const std::string& key);

    /**
     * This function examines the given upgrade request, as a server
     * would, and fills in the response to it.
     *
     * @param[in] request
     *     This is the request asking to upgrade the connection.
     *
     * @param[out] response
     *     This is where to fill in the response.  If the request is for
     *     a WebSocket upgrade, but is malformed, the response is set to
     *     "400 Bad Request".
     *
     * @param[in] trailer
     *     These are any characters received after the request.
     *
     * @return
     *     An indication of whether or not the upgrade was accepted
     *     is returned.
     */
    bool AnswerUpgrade(
        const Http::Request& request,
        Http::Response& response,
        const std::string& trailer
    );

}

#endif /* WEB_SOCKET_CLIENT_UPGRADE_OFFER_HPP */
